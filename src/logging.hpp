#ifndef __PROJECTS_JDIFF_SRC_LOGGING_HPP_
#define __PROJECTS_JDIFF_SRC_LOGGING_HPP_

#include <iostream>

namespace jdiff {

void set_verbose(bool verbose);
bool is_verbose();

}  // namespace jdiff

// Debug output goes to stderr; stdout is reserved for the delta dump.
#define DEBUG(var)                                                            \
    if (jdiff::is_verbose()) {                                                \
        std::cerr << "DEBUG: " << #var << " = " << (var) << std::endl;        \
    }

#define DEBUG_LOG(msg)                                                        \
    if (jdiff::is_verbose()) {                                                \
        std::cerr << "DEBUG: " << msg << std::endl;                           \
    }

#endif  // __PROJECTS_JDIFF_SRC_LOGGING_HPP_
