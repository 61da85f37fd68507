#ifndef __PROJECTS_JDIFF_SRC_CONFIG_HPP_
#define __PROJECTS_JDIFF_SRC_CONFIG_HPP_

#include <string>

namespace jdiff {

struct OutputPaths {
    std::string equal;
    std::string diff_ab;
    std::string diff_ba;
};

// <prefix>_eq.json, <prefix>_diff_ab.json, <prefix>_diff_ba.json
OutputPaths output_paths(const std::string &prefix);

std::string usage(const std::string &program);

struct Config {
    enum class Mode {
        WriteFiles,
        Print,
    };

    std::string first_input;
    std::string second_input;
    std::string output_prefix;  // empty in Print mode
    bool verbose = false;
    bool show_help = false;

    Mode mode() const { return output_prefix.empty() ? Mode::Print : Mode::WriteFiles; }

    /**
     * Accepted shapes:
     *   <input1> <input2> <output-prefix>   write the three projections
     *   <input1> <input2>                   print the delta to stdout
     * Options: -v/--verbose, -h/--help.
     */
    static bool from_args(int argc, const char *const argv[], Config &config, std::string &err_msg);
};

}  // namespace jdiff

#endif  // __PROJECTS_JDIFF_SRC_CONFIG_HPP_
