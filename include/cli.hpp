#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"

enum class CommandType
{
    PACK,
    UNPACK,
    INFO,
    HELP,
    VERSION
};

struct Command
{
    CommandType type = CommandType::HELP;
    PackConfig pack;
    UnpackConfig unpack;
    InfoConfig info;
};

// args excludes the program name, throws ConfigError on bad usage
Command parse_command_line(const std::vector<std::string> &args);

void print_usage(std::ostream &out);
