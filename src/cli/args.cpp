#include "cli/args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <sstream>

namespace chroma {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find("..") != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto missing = [&args](const char* flag) {
        args.errors.push_back(std::string("Missing value for ") + flag);
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-n") == 0 || strcmp(arg, "--colors") == 0) {
            if (i + 1 < argc) args.colors = clamp_int(std::atoi(argv[++i]), 1, 64, 6);
            else missing(arg);
        }
        else if (strcmp(arg, "--config") == 0) {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) {
                    args.errors.push_back("Rejected config path: " + args.config_path);
                    args.config_path.clear();
                }
            } else {
                missing(arg);
            }
        }
        else if (strcmp(arg, "--format") == 0) {
            if (i + 1 < argc) {
                std::string f = argv[++i];
                if (f == "text" || f == "json") {
                    args.format = f;
                } else {
                    args.errors.push_back("Unknown format: " + f);
                }
            } else {
                missing(arg);
            }
        }
        else if (strcmp(arg, "--color") == 0) {
            if (i + 1 < argc) {
                std::string m = argv[++i];
                if (m == "auto" || m == "none" || m == "16" || m == "256" || m == "truecolor") {
                    args.color_mode = m;
                } else {
                    args.errors.push_back("Unknown color mode: " + m);
                }
            } else {
                missing(arg);
            }
        }
        else if (strcmp(arg, "--compare") == 0) {
            if (i + 1 < argc) args.compare_hex = split_list(argv[++i]);
            else missing(arg);
        }
        else if (strcmp(arg, "--name") == 0) {
            if (i + 1 < argc) args.name_hex = argv[++i];
            else missing(arg);
        }
        else if (strcmp(arg, "--include-transparent") == 0) {
            args.include_transparent = true;
        }
        else if (strcmp(arg, "--no-swatch") == 0) {
            args.no_swatch = true;
        }
        else if (strcmp(arg, "--harmony") == 0) {
            args.harmony = true;
        }
        else if (strcmp(arg, "--suggest") == 0) {
            args.suggest = true;
        }
        else if (strcmp(arg, "--gradients") == 0) {
            args.gradients = true;
        }
        else if (strcmp(arg, "--profile-live") == 0) {
            args.profile_live = true;
        }
        else if (arg[0] != '-') {
            args.input = arg;
            if (!validate_path(args.input)) {
                args.errors.push_back("Rejected input path: " + args.input);
                args.input.clear();
            }
        }
        else {
            args.errors.push_back(std::string("Unknown option: ") + arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <IMAGE>\n\n", prog);
    printf("IMAGE:\n");
    printf("  Path to a PNG, JPEG, BMP, GIF, TGA or PSD file\n\n");
    printf("OPTIONS:\n");
    printf("  -n, --colors <N>          Palette size (default: 6, range: 1-64)\n");
    printf("      --include-transparent Sample pixels with alpha below 128 too\n");
    printf("      --config <FILE>       Config file path (default: platform-specific)\n");
    printf("      --format <FMT>        Output format: text, json\n");
    printf("      --color <MODE>        Color mode: auto, none, 16, 256, truecolor\n");
    printf("      --no-swatch           Print colors without swatch blocks\n");
    printf("      --harmony             Show harmony schemes for the dominant color\n");
    printf("      --suggest             Show palette completion suggestions\n");
    printf("      --gradients           Show gradient suggestions\n");
    printf("      --compare <HEX,...>   Score the palette against a list of colors\n");
    printf("      --name <HEX>          Print the name of a color and exit\n");
    printf("      --profile-live        Output stage timings as JSON to stderr\n");
    printf("  -h, --help                Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/chroma-engine/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/chroma-engine/config.toml\n");
    printf("    Windows: %%APPDATA%%\\chroma-engine\\config.toml\n");
}

}
