#ifndef BMP_COMMON_HPP
#define BMP_COMMON_HPP

#include <array>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../color.hpp"

struct File_header
{
    static constexpr std::size_t size_bytes {14};
    static constexpr std::array<unsigned char, 2> magic {0x42, 0x4D}; // "BM"

    std::array<unsigned char, 2> identifier {magic};
    std::uint32_t size {0};        // whole file, in bytes
    std::uint16_t reserved_1 {0};
    std::uint16_t reserved_2 {0};
    std::uint32_t offset {0};      // start of pixel array

    bool operator==(const File_header &) const = default;
};

struct Info_header
{
    static constexpr std::size_t size_bytes {40}; // BITMAPINFOHEADER

    enum class Compression: std::uint32_t {BI_RGB=0};

    std::uint32_t header_size {size_bytes};
    std::int32_t width {0};
    std::int32_t height {0};        // negative is top-to-bottom, positive bottom-to-top
    std::uint16_t color_planes {1};
    std::uint16_t bpp {0};
    Compression compression {Compression::BI_RGB};
    std::uint32_t raw_image_size {0}; // may be 0 for BI_RGB
    std::int32_t h_resolution {0};  // pixels per meter
    std::int32_t v_resolution {0};
    std::uint32_t palette_size {0};
    std::uint32_t important_colors {0};

    bool operator==(const Info_header &) const = default;
};

constexpr std::size_t bmp_headers_size = File_header::size_bytes + Info_header::size_bytes;

// the only bit depth accepted on decode
constexpr std::uint16_t supported_bpp {24};

struct Row_layout
{
    std::size_t bytes_per_row {0};
    std::size_t padding_per_row {0};
    std::size_t padded_bytes_per_image {0};
};

// rows are padded to a multiple of 4 bytes. a height of 0 gives an empty layout
Row_layout compute_padding(std::size_t pixel_count, std::uint16_t bpp, std::uint32_t abs_height);

// headers + padded pixel data. throws Illegal_parameter if it doesn't fit the 32-bit size field
std::uint32_t bmp_file_size(std::uint32_t abs_width, std::uint32_t abs_height, std::uint16_t bpp);

constexpr std::size_t bytes_per_pixel(std::uint16_t bpp) { return (bpp + 7u) / 8u; }

// well defined for INT32_MIN
constexpr std::uint32_t unsigned_abs(std::int32_t i)
{
    return i < 0 ? std::uint32_t{0} - static_cast<std::uint32_t>(i) : static_cast<std::uint32_t>(i);
}

File_header read_bmp_file_header(std::span<const unsigned char> data);
Info_header read_bmp_info_header(std::span<const unsigned char> data);

void write_bmp_file_header(std::vector<unsigned char> & out, const File_header & header);
void write_bmp_info_header(std::vector<unsigned char> & out, const Info_header & header);

File_header make_bmp_file_header(std::uint32_t file_size);

template <Bmp_pixel P>
Info_header make_bmp_info_header(std::int32_t width, std::int32_t height)
{
    return Info_header{
        .header_size      = Info_header::size_bytes,
        .width            = width,
        .height           = height,
        .color_planes     = 1,
        .bpp              = P::bits_per_pixel,
        .compression      = Info_header::Compression::BI_RGB,
        .raw_image_size   = 0,
        .h_resolution     = P::pixels_per_meter,
        .v_resolution     = P::pixels_per_meter,
        .palette_size     = 0,
        .important_colors = 0
    };
}

#endif // BMP_COMMON_HPP
