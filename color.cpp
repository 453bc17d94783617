#include "color.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "error.hpp"

Color Color::from_bytes(std::span<const unsigned char> bytes)
{
    if(std::size(bytes) != 3)
        throw Illegal_parameter{"expected exactly 3 bytes for a pixel, got " + std::to_string(std::size(bytes))};

    return {bytes[0], bytes[1], bytes[2]};
}

Color Color::from_hex(std::string_view hex)
{
    if(std::size(hex) != 7 || hex[0] != '#')
        throw Illegal_parameter{"expected '#RRGGBB' where each character after '#' is a hexadecimal digit"};

    std::array<unsigned char, 3> channels;
    for(std::size_t i = 0; i < std::size(channels); ++i)
    {
        auto digits = hex.substr(1 + 2 * i, 2);
        if(!std::isxdigit(static_cast<unsigned char>(digits[0])) || !std::isxdigit(static_cast<unsigned char>(digits[1])))
            throw Illegal_parameter{"invalid hexadecimal digit in color '" + std::string{hex} + "'"};

        unsigned int value {0};
        auto [ptr, ec] = std::from_chars(std::data(digits), std::data(digits) + std::size(digits), value, 16);
        if(ec != std::errc{} || ptr != std::data(digits) + std::size(digits))
            throw Illegal_parameter{"invalid hexadecimal digit in color '" + std::string{hex} + "'"};

        channels[i] = static_cast<unsigned char>(value);
    }

    return {channels[0], channels[1], channels[2]};
}

// formula from https://www.rapidtables.com/convert/color/hsv-to-rgb.html
Color Color::from_hsv(double hue, double saturation, double value)
{
    // written so NaN fails every check
    if(!(hue >= 0.0 && hue < 1.0))
        throw Illegal_parameter{"hue must be in the range of [0.0, 1.0)"};
    if(!(saturation >= 0.0 && saturation <= 1.0))
        throw Illegal_parameter{"saturation must be in the range of [0.0, 1.0]"};
    if(!(value >= 0.0 && value <= 1.0))
        throw Illegal_parameter{"value must be in the range of [0.0, 1.0]"};

    auto hue_deg = hue * 360.0;

    auto c = value * saturation;
    auto sector = static_cast<int>(hue_deg / 60.0);
    auto x = c * (1.0 - std::abs(sector % 2 - 1));
    auto m = value - c;

    double r {0.0}, g {0.0}, b {0.0};
    switch(sector)
    {
        case 0: r = c; g = x; b = 0.0; break;
        case 1: r = x; g = c; b = 0.0; break;
        case 2: r = 0.0; g = c; b = x; break;
        case 3: r = 0.0; g = x; b = c; break;
        case 4: r = x; g = 0.0; b = c; break;
        case 5: r = c; g = 0.0; b = x; break;
        default:
            // hue * 360 can round up to exactly 360
            throw Illegal_parameter{"hue exceeded range [0, 360)"};
    }

    auto to_channel = [m](double component)
    {
        return static_cast<unsigned char>(std::lround((component + m) * 255.0));
    };

    return {to_channel(r), to_channel(g), to_channel(b)};
}

std::string Color::to_hex() const
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    return buf;
}

double Color::distance(const Color & other) const
{
    auto dr = static_cast<double>(other.r) - static_cast<double>(r);
    auto dg = static_cast<double>(other.g) - static_cast<double>(g);
    auto db = static_cast<double>(other.b) - static_cast<double>(b);
    return std::sqrt(dr * dr + dg * dg + db * db);
}
