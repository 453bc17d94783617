#include "bmp_common.hpp"

#include <iterator>
#include <limits>
#include <string>

#include "binio.hpp"
#include "../error.hpp"

Row_layout compute_padding(std::size_t pixel_count, std::uint16_t bpp, std::uint32_t abs_height)
{
    if(abs_height == 0)
        return {};

    auto bytes_per_image = pixel_count * bytes_per_pixel(bpp);
    auto bytes_per_row = bytes_per_image / abs_height;

    auto remainder = bytes_per_row % 4;
    auto padding_per_row = remainder == 0 ? 0 : 4 - remainder;

    return {
        .bytes_per_row          = bytes_per_row,
        .padding_per_row        = padding_per_row,
        .padded_bytes_per_image = (bytes_per_row + padding_per_row) * abs_height
    };
}

std::uint32_t bmp_file_size(std::uint32_t abs_width, std::uint32_t abs_height, std::uint16_t bpp)
{
    auto pixel_count = static_cast<std::uint64_t>(abs_width) * abs_height;

    // checked before padding so the padded size can't overflow
    if(pixel_count * bytes_per_pixel(bpp) > std::numeric_limits<std::uint32_t>::max())
        throw Illegal_parameter{"image too large for BMP: " + std::to_string(abs_width) + 'x' + std::to_string(abs_height)};

    auto file_size = bmp_headers_size + compute_padding(pixel_count, bpp, abs_height).padded_bytes_per_image;
    if(file_size > std::numeric_limits<std::uint32_t>::max())
        throw Illegal_parameter{"image too large for BMP: " + std::to_string(file_size) + " bytes"};

    return static_cast<std::uint32_t>(file_size);
}

File_header read_bmp_file_header(std::span<const unsigned char> data)
{
    if(std::size(data) < File_header::size_bytes)
        throw Illegal_parameter{"BMP file header truncated: expected " + std::to_string(File_header::size_bytes) + " bytes, got " + std::to_string(std::size(data))};

    auto begin = std::begin(data);
    auto end = std::end(data);

    File_header header;
    header.identifier[0] = *begin++;
    header.identifier[1] = *begin++;
    if(header.identifier != File_header::magic)
        throw Illegal_parameter{"unsupported bitmap identifier"};

    readb(begin, end, header.size);
    readb(begin, end, header.reserved_1);
    readb(begin, end, header.reserved_2);
    readb(begin, end, header.offset);

    return header;
}

Info_header read_bmp_info_header(std::span<const unsigned char> data)
{
    if(std::size(data) < Info_header::size_bytes)
        throw Illegal_parameter{"BMP info header truncated: expected " + std::to_string(Info_header::size_bytes) + " bytes, got " + std::to_string(std::size(data))};

    auto begin = std::begin(data);
    auto end = std::end(data);

    Info_header header;
    readb(begin, end, header.header_size);
    readb(begin, end, header.width);
    readb(begin, end, header.height);
    readb(begin, end, header.color_planes);
    readb(begin, end, header.bpp);
    auto compression = readb<std::underlying_type_t<Info_header::Compression>>(begin, end);
    readb(begin, end, header.raw_image_size);
    readb(begin, end, header.h_resolution);
    readb(begin, end, header.v_resolution);
    readb(begin, end, header.palette_size);
    readb(begin, end, header.important_colors);

    switch(compression)
    {
        case static_cast<std::uint32_t>(Info_header::Compression::BI_RGB):
            header.compression = Info_header::Compression::BI_RGB;
            break;
        default:
            throw Illegal_parameter{"unknown compression identifier: " + std::to_string(compression)};
    }

    if(header.header_size != Info_header::size_bytes)
        throw Illegal_parameter{"unexpected bitmap information header size: " + std::to_string(header.header_size)};

    if(header.bpp != supported_bpp)
        throw Unsupported{"only 24bpp bitmaps are supported, got bit depth: " + std::to_string(header.bpp)};

    if(header.color_planes != 1)
        throw Illegal_parameter{"color plane count must be 1, got " + std::to_string(header.color_planes)};

    return header;
}

void write_bmp_file_header(std::vector<unsigned char> & out, const File_header & header)
{
    auto o = std::back_inserter(out);
    *o++ = header.identifier[0];
    *o++ = header.identifier[1];
    writeb(o, header.size);
    writeb(o, header.reserved_1);
    writeb(o, header.reserved_2);
    writeb(o, header.offset);
}

void write_bmp_info_header(std::vector<unsigned char> & out, const Info_header & header)
{
    auto o = std::back_inserter(out);
    writeb(o, header.header_size);
    writeb(o, header.width);
    writeb(o, header.height);
    writeb(o, header.color_planes);
    writeb(o, header.bpp);
    writeb(o, header.compression);
    writeb(o, header.raw_image_size);
    writeb(o, header.h_resolution);
    writeb(o, header.v_resolution);
    writeb(o, header.palette_size);
    writeb(o, header.important_colors);
}

File_header make_bmp_file_header(std::uint32_t file_size)
{
    return File_header{
        .identifier = File_header::magic,
        .size       = file_size,
        .reserved_1 = 0,
        .reserved_2 = 0,
        .offset     = static_cast<std::uint32_t>(bmp_headers_size)
    };
}
