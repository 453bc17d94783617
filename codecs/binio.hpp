#ifndef BINIO_HPP
#define BINIO_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

#include "../error.hpp"

template<typename T> concept Byte_input_iter = std::input_iterator<T> && requires { requires sizeof(*std::declval<T>()) == 1; };

template<typename T> concept Byte_output_iter = std::output_iterator<T, unsigned char>;

// mixed endian systems apparently do exist, so do a static_assert to make sure we're one or the other
static_assert(std::endian::native == std::endian::big || std::endian::native == std::endian::little);

template <typename T> requires std::is_integral_v<T>
T bswap(T a)
{
    auto & buf = reinterpret_cast<std::byte(&)[sizeof(T)]>(a);
    std::reverse(std::begin(buf), std::end(buf));
    return a;
}

template <typename T, Byte_input_iter InputIter> requires std::is_integral_v<T>
void readb(InputIter & begin, InputIter end, T & t, std::endian endian = std::endian::little)
{
    auto & buf = reinterpret_cast<std::byte(&)[sizeof(T)]>(t);
    for(auto && i: buf)
    {
        if(begin == end)
            throw Illegal_parameter{"Unexpected end of input"};
        i = static_cast<std::byte>(*begin++);
    }
    if(std::endian::native != endian)
        t = bswap(t);
}

template <typename T, Byte_input_iter InputIter> requires std::is_integral_v<T>
T readb(InputIter & begin, InputIter end, std::endian endian = std::endian::little)
{
    T t{0};
    readb(begin, end, t, endian);
    return t;
}

template<typename E, Byte_input_iter InputIter> requires std::is_enum_v<E>
E readb(InputIter & begin, InputIter end, std::endian endian = std::endian::little)
{
    return static_cast<E>(readb<std::underlying_type_t<E>>(begin, end, endian));
}

template <typename T, Byte_output_iter OutputIter> requires std::is_integral_v<T>
void writeb(OutputIter & o, T t, std::endian endian = std::endian::little)
{
    if(std::endian::native != endian)
        t = bswap(t);
    auto & buf = reinterpret_cast<unsigned char(&)[sizeof(T)]>(t);
    for(auto && b: buf)
        *o++ = b;
}

template <typename E, Byte_output_iter OutputIter> requires std::is_enum_v<E>
void writeb(OutputIter & o, E e, std::endian endian = std::endian::little)
{
    writeb(o, static_cast<std::underlying_type_t<E>>(e), endian);
}

#endif // BINIO_HPP
