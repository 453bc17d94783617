#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>

// base for everything the codec throws
struct Bmp_error: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// structurally valid input describing a format variant we don't implement
struct Unsupported: public Bmp_error
{
    explicit Unsupported(const std::string & msg): Bmp_error{"Unsupported: " + msg} {}
};

// malformed or inconsistent input
struct Illegal_parameter: public Bmp_error
{
    explicit Illegal_parameter(const std::string & msg): Bmp_error{"Illegal parameter: " + msg} {}
};

#endif // ERROR_HPP
