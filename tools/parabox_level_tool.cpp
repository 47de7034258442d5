#include "cli/LevelTool.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    auto options = PB::CLI::parse_level_tool_options(argc, argv, std::cerr);
    if (!options) {
        PB::CLI::print_level_tool_usage(std::cerr);
        return EXIT_FAILURE;
    }
    return PB::CLI::run_level_tool(*options, std::cout, std::cerr);
}
