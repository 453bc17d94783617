#include "io.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <cerrno>
#include <cstring>

std::vector<unsigned char> read_input_to_memory(std::istream & input)
{
    // read whole stream into memory
    std::vector<unsigned char> data;
    std::array<char, 4096> buffer;
    while(input)
    {
        input.read(std::data(buffer), std::size(buffer));
        if(input.bad())
            throw std::runtime_error {"Error reading input file"};

        data.insert(std::end(data), std::begin(buffer), std::begin(buffer) + input.gcount());
    }
    return data;
}

std::vector<unsigned char> read_file(const std::string & filename)
{
    if(filename == "-")
        return read_input_to_memory(std::cin);

    std::ifstream input{filename, std::ios_base::in | std::ios_base::binary};
    if(!input)
        throw std::runtime_error{"Could not open input file (" + filename + "): " + std::string{std::strerror(errno)}};

    return read_input_to_memory(input);
}

void write_file(const std::string & filename, std::span<const unsigned char> data)
{
    std::ofstream output_file;
    if(filename != "-")
    {
        output_file.open(filename, std::ios_base::out | std::ios_base::binary);
        if(!output_file)
            throw std::runtime_error {"Could not open " + filename + " for writing: " + std::strerror(errno)};
    }
    std::ostream & out = filename == "-" ? std::cout : output_file;

    out.write(reinterpret_cast<const char *>(std::data(data)), std::size(data));
    out.flush();
    if(!out)
        throw std::runtime_error {"Error writing to " + (filename == "-" ? std::string{"stdout"} : filename)};
}
