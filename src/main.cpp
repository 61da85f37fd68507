#include <cstdlib>
#include <iostream>
#include <string>

#include "config.hpp"
#include "jdiff.hpp"
#include "logging.hpp"

int main(int argc, char const *argv[]) {
    const std::string program = argc > 0 ? argv[0] : "jdiff";

    jdiff::Config config;
    std::string err_msg;
    if (!jdiff::Config::from_args(argc, argv, config, err_msg)) {
        std::cerr << "Error parsing arguments: " << err_msg << "." << std::endl;
        std::cerr << jdiff::usage(program);
        return EXIT_FAILURE;
    }

    if (config.show_help) {
        std::cout << jdiff::usage(program);
        return EXIT_SUCCESS;
    }

    jdiff::set_verbose(config.verbose);

    if (!jdiff::run(config, err_msg)) {
        std::cerr << "Error: " << err_msg << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
