#pragma once

#include <string>
#include <vector>

namespace chroma {

struct Args {
    std::string input;
    std::string config_path;
    std::string format;
    std::string color_mode;
    std::string name_hex;
    std::vector<std::string> compare_hex;

    // 0 when not given on the command line.
    int colors = 0;

    bool include_transparent = false;
    bool no_swatch = false;
    bool harmony = false;
    bool suggest = false;
    bool gradients = false;
    bool profile_live = false;

    bool show_help = false;
    std::vector<std::string> errors;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
