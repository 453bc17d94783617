#ifndef ARGS_HPP
#define ARGS_HPP

#include <optional>
#include <string>

#include <cstdint>

#include "color.hpp"
#include "config.h"

struct Args
{
    enum class Command {info, pick, match, remap, fill} command;
    std::string input_filename;   // - for stdin
    std::string palette_filename; // reference image searched by match / remap
    std::string output_filename;  // - for stdout
    std::optional<Color> color;   // from --color or --hsv
    std::uint32_t x;              // pick coords
    std::uint32_t y;
    std::int32_t width;           // fill size
    std::int32_t height;
    bool verbose;                 // print decode details to stderr
    std::string help_text;
};

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[]);

// "H,S,V", each a decimal in the ranges accepted by Color::from_hsv
Color parse_hsv(const std::string & hsv);

#endif // ARGS_HPP
