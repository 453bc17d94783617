// Inspect BMP images and map colors onto a reference palette image
#include <iostream>

#include <cstdlib>

#include "args.hpp"
#include "commands.hpp"

int main(int argc, char * argv[])
{
    auto args = parse_args(argc, argv);
    if(!args)
        return EXIT_FAILURE;

    try
    {
        run_command(*args);
    }
    catch(const std::runtime_error & e)
    {
        std::cerr<<e.what()<<'\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
