#include "args.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include <cstdlib>

#include <cxxopts.hpp>

#include "error.hpp"

static const std::array<std::pair<const char *, Args::Command>, 5> commands =
{{
    {"info",  Args::Command::info},
    {"pick",  Args::Command::pick},
    {"match", Args::Command::match},
    {"remap", Args::Command::remap},
    {"fill",  Args::Command::fill},
}};

Color parse_hsv(const std::string & hsv)
{
    std::array<double, 3> components;
    std::istringstream in{hsv};

    for(std::size_t i = 0; i < std::size(components); ++i)
    {
        std::string field;
        if(!std::getline(in, field, ','))
            throw Illegal_parameter{"expected 'H,S,V', got '" + hsv + "'"};

        char * end {nullptr};
        components[i] = std::strtod(field.c_str(), &end);
        if(std::empty(field) || end != field.c_str() + std::size(field))
            throw Illegal_parameter{"invalid number in HSV color: '" + field + "'"};
    }

    if(std::string rest; std::getline(in, rest))
        throw Illegal_parameter{"expected 'H,S,V', got '" + hsv + "'"};

    return Color::from_hsv(components[0], components[1], components[2]);
}

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[])
{
    auto prog_name = std::string{argv[0]};
    if(auto sep_pos = prog_name.find_last_of("\\/"); sep_pos != std::string::npos)
        prog_name = prog_name.substr(sep_pos + 1);

    cxxopts::Options options{prog_name, "Inspect 24-bit BMP images and map colors onto a reference palette image (" BMPMATCH_NAME " " BMPMATCH_VERSION ")"};

    try
    {
        options.add_options()
            ("h,help",    "Show this message and quit")
            ("version",   "Show version and quit")
            ("v,verbose", "Print decoding details to stderr")
            ("o,output",  "Output image path. Output to stdout if '-'",                  cxxopts::value<std::string>()->default_value("-"),                      "OUTPUT_FILE")
            ("p,palette", "Reference image searched for the nearest color",             cxxopts::value<std::string>()->default_value(BMPMATCH_DEFAULT_PALETTE), "PALETTE_FILE");

        const std::string color_group = "Color";
        options.add_options(color_group)
            ("c,color", "Color as #RRGGBB",                                 cxxopts::value<std::string>(), "HEX")
            ("hsv",     "Color as hue,saturation,value. Hue in [0, 1), others in [0, 1]", cxxopts::value<std::string>(), "H,S,V");

        const std::string geometry_group = "Geometry";
        options.add_options(geometry_group)
            ("x",      "Column for pick",                                cxxopts::value<std::uint32_t>(), "X")
            ("y",      "Row for pick",                                   cxxopts::value<std::uint32_t>(), "Y")
            ("width",  "Width of filled image",                          cxxopts::value<std::int32_t>(),  "WIDTH")
            ("height", "Height of filled image. Negative for top-to-bottom row order", cxxopts::value<std::int32_t>(), "HEIGHT");

        options.add_options()
            ("command", "One of: info, pick, match, remap, fill", cxxopts::value<std::string>())
            ("input",   "Input image path. Read from stdin if -",  cxxopts::value<std::string>()->default_value("-"));

        options.parse_positional({"command", "input"});
        options.positional_help("COMMAND [INPUT]");
    }
    catch(const cxxopts::exceptions::exception & e)
    {
        std::cerr<<"Error building argument parser: "<<e.what()<<'\n';
        return {};
    }

    auto help = [&options](const std::string & msg = "") -> std::string
    {
        auto txt = options.help();

        txt += "\n"
               " Commands:\n"
               "  info  INPUT                          Print header fields\n"
               "  pick  INPUT --x X --y Y              Print the color at (X, Y)\n"
               "  match --palette P --color|--hsv C    Print the location of the nearest palette color\n"
               "  remap INPUT --palette P -o OUTPUT    Replace each pixel by its nearest palette color\n"
               "  fill  --width W --height H --color|--hsv C -o OUTPUT\n"
               "                                       Write a solid color image\n";

        if(!std::empty(msg))
            txt += '\n' + msg + '\n';

        return txt;
    };

    try
    {
        auto args = options.parse(argc, argv);

        if(args.count("help"))
        {
            std::cerr<<help()<<'\n';
            return {};
        }

        if(args.count("version"))
        {
            std::cout<<BMPMATCH_NAME<<' '<<BMPMATCH_VERSION<<'\n';
            return {};
        }

        if(!args.count("command"))
        {
            std::cerr<<help("No command specified")<<'\n';
            return {};
        }

        auto command_name = args["command"].as<std::string>();
        auto command = std::find_if(std::begin(commands), std::end(commands), [&command_name](auto && c) { return command_name == c.first; });
        if(command == std::end(commands))
        {
            std::cerr<<help("Unknown command: " + command_name)<<'\n';
            return {};
        }

        if(args.count("color") && args.count("hsv"))
        {
            std::cerr<<help("Only one of --color or --hsv may be specified")<<'\n';
            return {};
        }

        std::optional<Color> color;
        try
        {
            if(args.count("color"))
                color = Color::from_hex(args["color"].as<std::string>());
            else if(args.count("hsv"))
                color = parse_hsv(args["hsv"].as<std::string>());
            else if(command->second == Args::Command::fill)
                color = Color::from_hex(BMPMATCH_DEFAULT_FILL_COLOR);
        }
        catch(const Bmp_error & e)
        {
            std::cerr<<help(e.what())<<'\n';
            return {};
        }

        switch(command->second)
        {
            case Args::Command::pick:
                if(!args.count("x") || !args.count("y"))
                {
                    std::cerr<<help("pick requires --x and --y")<<'\n';
                    return {};
                }
                break;

            case Args::Command::match:
                if(!color)
                {
                    std::cerr<<help("match requires --color or --hsv")<<'\n';
                    return {};
                }
                break;

            case Args::Command::fill:
                if(!args.count("width") || !args.count("height"))
                {
                    std::cerr<<help("fill requires --width and --height")<<'\n';
                    return {};
                }
                if(args["width"].as<std::int32_t>() == 0 || args["height"].as<std::int32_t>() == 0)
                {
                    std::cerr<<help("Values for --width and --height cannot be 0")<<'\n';
                    return {};
                }
                break;

            case Args::Command::info:
            case Args::Command::remap:
                break;
        }

        return Args{
            .command          = command->second,
            .input_filename   = args["input"].as<std::string>(),
            .palette_filename = args["palette"].as<std::string>(),
            .output_filename  = args["output"].as<std::string>(),
            .color            = color,
            .x                = args.count("x") ? args["x"].as<std::uint32_t>() : 0u,
            .y                = args.count("y") ? args["y"].as<std::uint32_t>() : 0u,
            .width            = args.count("width") ? args["width"].as<std::int32_t>() : 0,
            .height           = args.count("height") ? args["height"].as<std::int32_t>() : 0,
            .verbose          = static_cast<bool>(args.count("verbose")),
            .help_text        = help()
        };
    }
    catch(const cxxopts::exceptions::exception & e)
    {
        std::cerr<<help(e.what())<<'\n';
        return {};
    }
}
