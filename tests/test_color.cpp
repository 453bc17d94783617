#include <catch2/catch.hpp>

#include <array>
#include <limits>

#include "color.hpp"
#include "error.hpp"

TEST_CASE("from_bytes takes exactly 3 bytes in RGB order", "[color]")
{
    const std::array<unsigned char, 3> rgb {0x10, 0x20, 0x30};
    REQUIRE(Color::from_bytes(rgb) == Color{0x10, 0x20, 0x30});

    const std::array<unsigned char, 2> short_buf {0x10, 0x20};
    REQUIRE_THROWS_AS(Color::from_bytes(short_buf), Illegal_parameter);

    const std::array<unsigned char, 4> long_buf {0x10, 0x20, 0x30, 0x40};
    REQUIRE_THROWS_AS(Color::from_bytes(long_buf), Illegal_parameter);
}

TEST_CASE("to_bytes is RGB order", "[color]")
{
    auto bytes = Color{1, 2, 3}.to_bytes();
    REQUIRE(bytes == std::array<unsigned char, 3>{1, 2, 3});
}

TEST_CASE("from_hex parses #RRGGBB", "[color]")
{
    REQUIRE(Color::from_hex("#4CAF50") == Color{76, 175, 80});
    REQUIRE(Color::from_hex("#4caf50") == Color{76, 175, 80});
    REQUIRE(Color::from_hex("#000000").is_black());
    REQUIRE(Color::from_hex("#FFFFFF").is_white());
}

TEST_CASE("from_hex rejects malformed strings", "[color]")
{
    REQUIRE_THROWS_AS(Color::from_hex("#abc"), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hex("4CAF500"), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hex("#4CAF5G"), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hex("#4CAF500"), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hex("#+CAF50"), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hex(""), Illegal_parameter);
}

TEST_CASE("to_hex is the inverse of from_hex", "[color]")
{
    REQUIRE(Color{76, 175, 80}.to_hex() == "#4CAF50");
    REQUIRE(Color{0, 0, 0}.to_hex() == "#000000");
    REQUIRE(Color::from_hex(Color{1, 254, 16}.to_hex()) == Color{1, 254, 16});
}

TEST_CASE("from_hsv", "[color]")
{
    SECTION("zero saturation is gray")
    {
        REQUIRE(Color::from_hsv(0.0, 0.0, 1.0) == Color{255, 255, 255});
        REQUIRE(Color::from_hsv(0.5, 0.0, 0.0) == Color{0, 0, 0});
    }

    SECTION("primaries")
    {
        REQUIRE(Color::from_hsv(0.0, 1.0, 1.0) == Color{255, 0, 0});
        // 135 degrees, sector 2
        REQUIRE(Color::from_hsv(0.375, 1.0, 1.0) == Color{0, 255, 0});
        // 270 degrees, sector 4
        REQUIRE(Color::from_hsv(0.75, 1.0, 1.0) == Color{0, 0, 255});
    }

    SECTION("odd sectors take the secondary component at full chroma")
    {
        // 90 degrees, sector 1
        REQUIRE(Color::from_hsv(0.25, 1.0, 1.0) == Color{255, 255, 0});
        // 30 degrees, sector 0
        REQUIRE(Color::from_hsv(30.0 / 360.0, 1.0, 1.0) == Color{255, 0, 0});
    }

    SECTION("channels are rounded")
    {
        // m = 0.5, 0.5 * 255 = 127.5
        REQUIRE(Color::from_hsv(0.0, 0.0, 0.5) == Color{128, 128, 128});
    }
}

TEST_CASE("from_hsv domain checks", "[color]")
{
    REQUIRE_THROWS_AS(Color::from_hsv(1.0, 0.5, 0.5), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(-0.1, 0.5, 0.5), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(0.5, 1.5, 0.5), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(0.5, -0.5, 0.5), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(0.5, 0.5, 1.01), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(0.5, 0.5, -1.0), Illegal_parameter);
    REQUIRE_THROWS_AS(Color::from_hsv(std::numeric_limits<double>::quiet_NaN(), 0.5, 0.5), Illegal_parameter);
    REQUIRE_NOTHROW(Color::from_hsv(0.0, 1.0, 1.0));
}

TEST_CASE("black and white are exact", "[color]")
{
    REQUIRE(Color{0, 0, 0}.is_black());
    REQUIRE_FALSE(Color{0, 0, 1}.is_black());
    REQUIRE(Color{255, 255, 255}.is_white());
    REQUIRE_FALSE(Color{255, 254, 255}.is_white());
    REQUIRE_FALSE(Color{0, 0, 0}.is_white());
}

TEST_CASE("distance is unnormalized euclidean", "[color]")
{
    REQUIRE(Color{0, 0, 0}.distance(Color{0, 0, 0}) == 0.0);
    REQUIRE(Color{0, 0, 0}.distance(Color{3, 4, 0}) == Approx(5.0));
    REQUIRE(Color{0, 0, 0}.distance(Color{255, 255, 255}) == Approx(441.6729559));
    REQUIRE(Color{10, 20, 30}.distance(Color{1, 2, 3}) == Color{1, 2, 3}.distance(Color{10, 20, 30}));
}
