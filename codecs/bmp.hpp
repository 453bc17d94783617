#ifndef BMP_HPP
#define BMP_HPP

#include <algorithm>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <cstdint>

#include "bmp_common.hpp"
#include "../color.hpp"
#include "../error.hpp"

inline bool is_bmp(std::span<const unsigned char> data)
{
    return std::size(data) >= std::size(File_header::magic)
        && std::equal(std::begin(File_header::magic), std::end(File_header::magic), std::begin(data));
}

// collects every row / pixel failure of a decode so they can be reported together
class Decode_errors
{
public:
    void add_row(std::size_t row, const std::string & msg)
    {
        errors_.push_back("row " + std::to_string(row) + ": " + msg);
    }
    void add_pixel(std::size_t row, std::size_t col, const std::string & msg)
    {
        errors_.push_back("row " + std::to_string(row) + ", pixel " + std::to_string(col) + ": " + msg);
    }

    bool empty() const { return std::empty(errors_); }
    std::size_t size() const { return std::size(errors_); }

    // no-op when nothing was recorded
    void throw_if_any() const
    {
        if(empty())
            return;

        std::string msg = "bad pixel data (" + std::to_string(size()) + " error" + (size() == 1 ? "" : "s") + ")\n";
        for(auto && e: errors_)
            msg += '\n' + e;

        throw Illegal_parameter{msg};
    }

private:
    std::vector<std::string> errors_;
};

template <Bmp_pixel P>
class Bitmap
{
public:
    struct Location
    {
        std::uint32_t x {0};
        std::uint32_t y {0};
        bool operator==(const Location &) const = default;
    };

    // a positive height is stored as-is (bottom-to-top per the format)
    Bitmap(std::int32_t width, std::int32_t height, std::vector<P> pixels);

    static Bitmap decode(std::span<const unsigned char> data);
    std::vector<unsigned char> encode() const;

    std::uint32_t get_width() const { return unsigned_abs(info_header_.width); }
    std::uint32_t get_height() const { return unsigned_abs(info_header_.height); }
    std::int32_t get_raw_width() const { return info_header_.width; }
    std::int32_t get_raw_height() const { return info_header_.height; }
    bool is_top_to_bottom() const { return info_header_.height < 0; }

    const File_header & get_file_header() const { return file_header_; }
    const Info_header & get_info_header() const { return info_header_; }
    const std::vector<P> & get_pixels() const { return pixels_; }

    // padding as it would be written by encode()
    Row_layout get_row_layout() const { return compute_padding(std::size(pixels_), P::bits_per_pixel, get_height()); }

    std::optional<P> pixel_at(std::uint32_t x, std::uint32_t y) const;

    // first closest pixel in row-major order
    std::optional<Location> nearest_match(const P & target) const;

private:
    Bitmap(const File_header & file_header, const Info_header & info_header, std::vector<P> pixels):
        file_header_{file_header}, info_header_{info_header}, pixels_(std::move(pixels))
    {}

    File_header file_header_;
    Info_header info_header_;
    std::vector<P> pixels_;
};

template <Bmp_pixel P>
Bitmap<P>::Bitmap(std::int32_t width, std::int32_t height, std::vector<P> pixels):
    info_header_{make_bmp_info_header<P>(width, height)},
    pixels_(std::move(pixels))
{
    auto abs_height = unsigned_abs(height);
    if(std::size(pixels_) != static_cast<std::uint64_t>(unsigned_abs(width)) * abs_height)
        throw Illegal_parameter{"pixel count (" + std::to_string(std::size(pixels_)) + ") is not equal to width * height ("
            + std::to_string(unsigned_abs(width)) + " * " + std::to_string(abs_height) + ")"};

    file_header_ = make_bmp_file_header(bmp_file_size(unsigned_abs(width), abs_height, P::bits_per_pixel));
}

template <Bmp_pixel P>
Bitmap<P> Bitmap<P>::decode(std::span<const unsigned char> data)
{
    auto file_header = read_bmp_file_header(data);
    auto info_header = read_bmp_info_header(data.subspan(File_header::size_bytes));

    if(file_header.offset < bmp_headers_size || file_header.offset > std::size(data))
        throw Illegal_parameter{"invalid BMP pixel offset value: " + std::to_string(file_header.offset)};

    const auto width = unsigned_abs(info_header.width);
    const auto height = unsigned_abs(info_header.height);
    const auto pixel_size = bytes_per_pixel(info_header.bpp);
    const auto pixel_count = static_cast<std::uint64_t>(width) * height;

    const auto layout = compute_padding(pixel_count, info_header.bpp, height);
    const auto bytes_per_row = static_cast<std::size_t>(width) * pixel_size;
    const auto bytes_per_padded_row = bytes_per_row + layout.padding_per_row;

    auto pixel_data = data.subspan(file_header.offset);

    std::vector<P> pixels;
    pixels.reserve(std::min<std::uint64_t>(pixel_count, std::size(pixel_data) / std::max<std::size_t>(pixel_size, 1)));

    Decode_errors errors;
    for(std::size_t row = 0; width != 0 && row < height; ++row)
    {
        auto row_start = row * bytes_per_padded_row;
        if(row_start + bytes_per_padded_row > std::size(pixel_data))
        {
            // every row after this one is missing too
            errors.add_row(row, "truncated: expected " + std::to_string(bytes_per_padded_row) + " bytes, "
                + std::to_string(row_start < std::size(pixel_data) ? std::size(pixel_data) - row_start : 0) + " available, "
                + std::to_string(height - row) + " row(s) missing");
            break;
        }

        // padding at the end of the row is skipped
        auto row_data = pixel_data.subspan(row_start, bytes_per_row);
        for(std::size_t col = 0; col < width; ++col)
        {
            try
            {
                pixels.push_back(P::from_bytes(row_data.subspan(col * pixel_size, pixel_size)));
            }
            catch(const Bmp_error & e)
            {
                errors.add_pixel(row, col, e.what());
            }
        }
    }

    errors.throw_if_any();

    return Bitmap{file_header, info_header, std::move(pixels)};
}

template <Bmp_pixel P>
std::vector<unsigned char> Bitmap<P>::encode() const
{
    const auto layout = compute_padding(std::size(pixels_), P::bits_per_pixel, get_height());

    std::vector<unsigned char> out;
    out.reserve(bmp_headers_size + layout.padded_bytes_per_image);

    // size and offset follow the data actually written, not what was decoded
    write_bmp_file_header(out, make_bmp_file_header(static_cast<std::uint32_t>(bmp_headers_size + layout.padded_bytes_per_image)));
    write_bmp_info_header(out, info_header_);

    const auto width = get_width();
    if(width == 0)
        return out;

    for(std::size_t row_start = 0; row_start < std::size(pixels_); row_start += width)
    {
        for(std::size_t col = 0; col < width; ++col)
        {
            auto bytes = pixels_[row_start + col].to_bytes();
            out.insert(std::end(out), std::begin(bytes), std::end(bytes));
        }
        out.insert(std::end(out), layout.padding_per_row, 0);
    }

    return out;
}

template <Bmp_pixel P>
std::optional<P> Bitmap<P>::pixel_at(std::uint32_t x, std::uint32_t y) const
{
    const auto width = get_width();
    if(x >= width || y >= get_height())
        return std::nullopt;

    return pixels_[static_cast<std::size_t>(y) * width + x];
}

template <Bmp_pixel P>
auto Bitmap<P>::nearest_match(const P & target) const -> std::optional<Location>
{
    const auto width = get_width();

    std::optional<Location> best;
    auto best_distance = std::numeric_limits<double>::infinity();

    for(std::size_t i = 0; i < std::size(pixels_); ++i)
    {
        auto distance = static_cast<double>(pixels_[i].distance(target));
        if(distance < best_distance)
        {
            best_distance = distance;
            best = Location{static_cast<std::uint32_t>(i % width), static_cast<std::uint32_t>(i / width)};
        }
    }

    return best;
}

#endif // BMP_HPP
