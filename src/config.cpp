#include "config.hpp"

#include <string>
#include <vector>

#define RET_ERROR(_err_msg) \
    err_msg = _err_msg;     \
    return false;

namespace jdiff {

OutputPaths output_paths(const std::string &prefix) {
    return OutputPaths{prefix + "_eq.json", prefix + "_diff_ab.json", prefix + "_diff_ba.json"};
}

std::string usage(const std::string &program) {
    return "Usage: " + program + " [-v|--verbose] <input1> <input2> [<output-prefix>]\n"
           "  With <output-prefix> P, writes P_eq.json, P_diff_ab.json and P_diff_ba.json.\n"
           "  Without it, prints the structural delta to stdout.\n";
}

bool Config::from_args(int argc, const char *const argv[], Config &config, std::string &err_msg) {
    config = Config();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return true;
        } else if (arg.length() > 1 && arg[0] == '-') {
            RET_ERROR("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2 && positional.size() != 3) {
        RET_ERROR("Invalid number of arguments: <input1> <input2> <output-prefix>");
    }

    config.first_input = positional[0];
    config.second_input = positional[1];
    if (positional.size() == 3) {
        if (positional[2].empty()) {
            RET_ERROR("Output prefix must not be empty");
        }
        config.output_prefix = positional[2];
    }
    return true;
}

}  // namespace jdiff
