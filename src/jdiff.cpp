#include "jdiff.hpp"

#include <json/value.h>

#include <string>

#include "delta.hpp"
#include "json_io.hpp"
#include "logging.hpp"
#include "projector.hpp"

#define RET_ERROR(_err_msg) \
    err_msg = _err_msg;     \
    return false;

namespace jdiff {

namespace {

bool write_projections(const Delta &delta, const std::string &prefix, std::string &err_msg) {
    const OutputPaths paths = output_paths(prefix);
    const Projections projections = project_all(delta);

    if (!write_json_file(paths.equal, projections.equal, err_msg)) {
        return false;
    }
    if (!write_json_file(paths.diff_ab, projections.diff_ab, err_msg)) {
        return false;
    }
    if (!write_json_file(paths.diff_ba, projections.diff_ba, err_msg)) {
        return false;
    }
    return true;
}

}  // namespace

bool run(const Config &config, std::string &err_msg, std::ostream &out) {
    Json::Value first, second;

    DEBUG(config.first_input)
    if (!read_json_file(config.first_input, first, err_msg)) {
        return false;
    }
    DEBUG(config.second_input)
    if (!read_json_file(config.second_input, second, err_msg)) {
        return false;
    }

    const Delta delta = compare(first, second);

    if (is_verbose()) {
        const DeltaStats stats = count_leaves(delta);
        DEBUG_LOG("root delta is " << kind_name(delta.kind()));
        DEBUG(stats.equal)
        DEBUG(stats.different_content)
        DEBUG(stats.different_variant)
        DEBUG(stats.missing_in_second)
        DEBUG(stats.missing_in_first)
    }

    if (config.mode() == Config::Mode::Print) {
        out << to_pretty_string(to_json(delta));
        if (!out) {
            RET_ERROR("Cannot write delta to output stream");
        }
        return true;
    }

    DEBUG(config.output_prefix)
    return write_projections(delta, config.output_prefix, err_msg);
}

}  // namespace jdiff
