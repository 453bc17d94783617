#ifndef COLOR_HPP
#define COLOR_HPP

#include <array>
#include <concepts>
#include <span>
#include <string>
#include <string_view>

#include <cstdint>

// the operations a pixel format must provide to be stored in a Bitmap
template <typename P>
concept Bmp_pixel = requires(const P & p, const P & other, std::span<const unsigned char> bytes)
{
    { P::bits_per_pixel } -> std::convertible_to<std::uint16_t>;
    { P::pixels_per_meter } -> std::convertible_to<std::int32_t>;
    { P::from_bytes(bytes) } -> std::same_as<P>;
    { p.to_bytes() } -> std::convertible_to<std::array<unsigned char, (P::bits_per_pixel + 7) / 8>>;
    { p.is_black() } -> std::same_as<bool>;
    { p.is_white() } -> std::same_as<bool>;
    { p.distance(other) } -> std::convertible_to<double>;
};

// 24-bit RGB
struct Color
{
    static constexpr std::uint16_t bits_per_pixel {24};
    static constexpr std::int32_t pixels_per_meter {2835}; // 72 DPI

    unsigned char r{0}, g{0}, b{0};
    constexpr Color(){}
    constexpr Color(unsigned char r, unsigned char g, unsigned char b): r{r}, g{g}, b{b} {}

    static Color from_bytes(std::span<const unsigned char> bytes);

    // "#RRGGBB"
    static Color from_hex(std::string_view hex);

    // hue in [0, 1), saturation and value in [0, 1]
    static Color from_hsv(double hue, double saturation, double value);

    constexpr bool is_black() const { return r == 0x00 && g == 0x00 && b == 0x00; }
    constexpr bool is_white() const { return r == 0xFF && g == 0xFF && b == 0xFF; }

    constexpr std::array<unsigned char, 3> to_bytes() const { return {r, g, b}; }
    std::string to_hex() const;

    // not normalized, only useful for comparing against other distances
    double distance(const Color & other) const;

    constexpr bool operator==(const Color & other) const
    {
        return r == other.r
            && g == other.g
            && b == other.b;
    }
};

static_assert(Bmp_pixel<Color>);

#endif // COLOR_HPP
