#ifndef __PROJECTS_JDIFF_SRC_JDIFF_HPP_
#define __PROJECTS_JDIFF_SRC_JDIFF_HPP_

#include <iostream>
#include <string>

#include "config.hpp"

namespace jdiff {

/**
 * Compares the two configured inputs.
 *
 * WriteFiles mode writes the equal, diff_ab and diff_ba projections in that
 * order and stops at the first failure, so earlier files may remain. Print
 * mode writes the encoded delta to `out`.
 */
bool run(const Config &config, std::string &err_msg, std::ostream &out = std::cout);

}  // namespace jdiff

#endif  // __PROJECTS_JDIFF_SRC_JDIFF_HPP_
