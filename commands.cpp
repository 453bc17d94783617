#include "commands.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "io.hpp"

[[nodiscard]] Bmp_image load_bitmap(const std::string & filename, bool verbose)
{
    auto data = read_file(filename);

    if(!is_bmp(data))
        throw std::runtime_error{"Not a BMP file: " + filename};

    try
    {
        auto img = Bmp_image::decode(data);
        if(verbose)
        {
            auto layout = img.get_row_layout();
            std::cerr<<filename<<": "<<img.get_width()<<'x'<<img.get_height()
                <<", "<<std::size(data)<<" bytes, pixel data at "<<img.get_file_header().offset
                <<", "<<layout.bytes_per_row<<" bytes per row + "<<layout.padding_per_row<<" padding\n";
        }
        return img;
    }
    catch(const Bmp_error & e)
    {
        throw std::runtime_error{"Error reading BMP " + filename + ": " + e.what()};
    }
}

void print_info(std::ostream & out, const Bmp_image & img)
{
    auto & file_header = img.get_file_header();
    auto & info_header = img.get_info_header();
    auto layout = img.get_row_layout();

    out<<"width:           "<<img.get_width()<<'\n'
       <<"height:          "<<img.get_height()<<'\n'
       <<"raw width:       "<<img.get_raw_width()<<'\n'
       <<"raw height:      "<<img.get_raw_height()<<'\n'
       <<"row order:       "<<(img.is_top_to_bottom() ? "top-to-bottom" : "bottom-to-top")<<'\n'
       <<"bits per pixel:  "<<info_header.bpp<<'\n'
       <<"resolution:      "<<info_header.h_resolution<<'x'<<info_header.v_resolution<<" px/m\n"
       <<"file size:       "<<file_header.size<<'\n'
       <<"pixel offset:    "<<file_header.offset<<'\n'
       <<"row padding:     "<<layout.padding_per_row<<'\n';
}

[[nodiscard]] Bmp_image remap_to_palette(const Bmp_image & img, const Bmp_image & palette)
{
    std::vector<Color> pixels;
    pixels.reserve(std::size(img.get_pixels()));

    for(auto && p: img.get_pixels())
    {
        auto loc = palette.nearest_match(p);
        if(!loc)
            throw std::runtime_error{"Palette image is empty"};

        pixels.push_back(*palette.pixel_at(loc->x, loc->y));
    }

    return Bmp_image{img.get_raw_width(), img.get_raw_height(), std::move(pixels)};
}

void run_command(const Args & args)
{
    switch(args.command)
    {
        case Args::Command::info:
            print_info(std::cout, load_bitmap(args.input_filename, args.verbose));
            break;

        case Args::Command::pick:
        {
            auto img = load_bitmap(args.input_filename, args.verbose);
            auto color = img.pixel_at(args.x, args.y);
            if(!color)
                throw std::runtime_error{"Coordinates (" + std::to_string(args.x) + ", " + std::to_string(args.y) + ") out of range for "
                    + std::to_string(img.get_width()) + 'x' + std::to_string(img.get_height()) + " image"};

            std::cout<<color->to_hex()<<'\n';
            break;
        }

        case Args::Command::match:
        {
            auto palette = load_bitmap(args.palette_filename, args.verbose);
            auto loc = palette.nearest_match(*args.color);
            if(!loc)
                throw std::runtime_error{"Palette image is empty"};

            std::cout<<loc->x<<','<<loc->y<<' '<<palette.pixel_at(loc->x, loc->y)->to_hex()<<'\n';
            break;
        }

        case Args::Command::remap:
        {
            auto img = load_bitmap(args.input_filename, args.verbose);
            auto palette = load_bitmap(args.palette_filename, args.verbose);
            write_file(args.output_filename, remap_to_palette(img, palette).encode());
            break;
        }

        case Args::Command::fill:
        {
            // rejects oversized images before allocating the pixels
            (void)bmp_file_size(unsigned_abs(args.width), unsigned_abs(args.height), Color::bits_per_pixel);

            auto count = static_cast<std::size_t>(unsigned_abs(args.width)) * unsigned_abs(args.height);
            Bmp_image img{args.width, args.height, std::vector<Color>(count, *args.color)};
            write_file(args.output_filename, img.encode());
            break;
        }
    }
}
