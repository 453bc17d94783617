#ifndef IO_HPP
#define IO_HPP

#include <istream>
#include <span>
#include <string>
#include <vector>

std::vector<unsigned char> read_input_to_memory(std::istream & input);

// "-" reads stdin / writes stdout
std::vector<unsigned char> read_file(const std::string & filename);
void write_file(const std::string & filename, std::span<const unsigned char> data);

#endif // IO_HPP
