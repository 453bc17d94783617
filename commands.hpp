#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <ostream>
#include <string>

#include "args.hpp"
#include "codecs/bmp.hpp"

using Bmp_image = Bitmap<Color>;

[[nodiscard]] Bmp_image load_bitmap(const std::string & filename, bool verbose);

void print_info(std::ostream & out, const Bmp_image & img);

// each pixel replaced by the nearest pixel of palette
[[nodiscard]] Bmp_image remap_to_palette(const Bmp_image & img, const Bmp_image & palette);

void run_command(const Args & args);

#endif // COMMANDS_HPP
