#include "logging.hpp"

namespace jdiff {

namespace {
bool verbose_enabled = false;
}

void set_verbose(bool verbose) {
    verbose_enabled = verbose;
}

bool is_verbose() {
    return verbose_enabled;
}

}  // namespace jdiff
