#include <catch2/catch.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "args.hpp"
#include "commands.hpp"
#include "error.hpp"
#include "io.hpp"

#include <unistd.h>

namespace
{
    // unique per process so concurrent test runs don't share files
    std::string temp_path(const std::string & name)
    {
        return (std::filesystem::temp_directory_path() / ("bmpmatch_" + name + "_" + std::to_string(::getpid()) + ".bmp")).string();
    }
}

TEST_CASE("parse_hsv", "[tool]")
{
    REQUIRE(parse_hsv("0,0,1") == Color{255, 255, 255});
    REQUIRE(parse_hsv("0.0,1.0,1.0") == Color{255, 0, 0});

    REQUIRE_THROWS_AS(parse_hsv("1,0,1"), Illegal_parameter);
    REQUIRE_THROWS_AS(parse_hsv("0,0"), Illegal_parameter);
    REQUIRE_THROWS_AS(parse_hsv("0,0,1,1"), Illegal_parameter);
    REQUIRE_THROWS_AS(parse_hsv("0,x,1"), Illegal_parameter);
    REQUIRE_THROWS_AS(parse_hsv("0,,1"), Illegal_parameter);
}

TEST_CASE("read_input_to_memory reads the whole stream", "[tool]")
{
    std::string text(10000, 'a');
    text[9999] = 'z';
    std::istringstream in{text};

    auto data = read_input_to_memory(in);
    REQUIRE(std::size(data) == 10000u);
    REQUIRE(data.back() == 'z');
}

TEST_CASE("remap_to_palette replaces each pixel by its nearest palette pixel", "[tool]")
{
    Bmp_image palette{2, 1, {{0, 0, 0}, {255, 255, 255}}};
    Bmp_image img{2, -2, {{10, 10, 10}, {250, 240, 255}, {128, 200, 200}, {1, 2, 3}}};

    auto remapped = remap_to_palette(img, palette);
    REQUIRE(remapped.get_raw_width() == 2);
    REQUIRE(remapped.get_raw_height() == -2);

    const std::vector<Color> expected {{0, 0, 0}, {255, 255, 255}, {255, 255, 255}, {0, 0, 0}};
    REQUIRE(remapped.get_pixels() == expected);

    Bmp_image empty{0, 0, {}};
    REQUIRE_THROWS_AS(remap_to_palette(img, empty), std::runtime_error);
}

TEST_CASE("print_info", "[tool]")
{
    Bmp_image img{3, -2, std::vector<Color>(6, Color{1, 2, 3})};

    std::ostringstream out;
    print_info(out, img);
    auto txt = out.str();

    REQUIRE(txt.find("width:           3\n") != std::string::npos);
    REQUIRE(txt.find("raw height:      -2\n") != std::string::npos);
    REQUIRE(txt.find("top-to-bottom") != std::string::npos);
    REQUIRE(txt.find("file size:       78\n") != std::string::npos);
    REQUIRE(txt.find("row padding:     3\n") != std::string::npos);
}

TEST_CASE("files round trip through load_bitmap", "[tool]")
{
    auto path = temp_path("roundtrip");

    Bmp_image img{5, 3, std::vector<Color>(15, Color::from_hex("#4CAF50"))};
    write_file(path, img.encode());

    auto loaded = load_bitmap(path, false);
    REQUIRE(loaded.get_pixels() == img.get_pixels());
    REQUIRE(loaded.get_info_header() == img.get_info_header());

    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(load_bitmap(path, false), std::runtime_error);
}

TEST_CASE("load_bitmap rejects non-BMP input", "[tool]")
{
    auto path = temp_path("not_bmp");
    const std::vector<unsigned char> junk {'P', '6', '\n', '1', ' ', '1'};
    write_file(path, junk);

    REQUIRE_THROWS_AS(load_bitmap(path, false), std::runtime_error);

    std::filesystem::remove(path);
}

TEST_CASE("fill rejects oversized images before allocating", "[tool]")
{
    Args args{
        .command          = Args::Command::fill,
        .input_filename   = "-",
        .palette_filename = "palette.bmp",
        .output_filename  = temp_path("fill_oversized"),
        .color            = Color{1, 2, 3},
        .x                = 0,
        .y                = 0,
        .width            = 2000000000,
        .height           = 2000000000,
        .verbose          = false,
        .help_text        = ""
    };

    REQUIRE_THROWS_AS(run_command(args), Illegal_parameter);
    REQUIRE_FALSE(std::filesystem::exists(args.output_filename));
}

TEST_CASE("fill writes a solid image", "[tool]")
{
    Args args{
        .command          = Args::Command::fill,
        .input_filename   = "-",
        .palette_filename = "palette.bmp",
        .output_filename  = temp_path("fill"),
        .color            = Color{1, 2, 3},
        .x                = 0,
        .y                = 0,
        .width            = 3,
        .height           = -2,
        .verbose          = false,
        .help_text        = ""
    };

    run_command(args);
    auto img = load_bitmap(args.output_filename, false);
    REQUIRE(img.get_raw_height() == -2);
    REQUIRE(img.get_pixels() == std::vector<Color>(6, Color{1, 2, 3}));

    std::filesystem::remove(args.output_filename);
}
