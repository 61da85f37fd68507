#ifndef __PROJECTS_JDIFF_SRC_JSON_IO_HPP_
#define __PROJECTS_JDIFF_SRC_JSON_IO_HPP_

#include <json/json.h>
#include <json/value.h>

#include <string>

namespace jdiff {

bool parse_json(const std::string &text, Json::Value &out, std::string &err_msg);

bool read_json_file(const std::string &path, Json::Value &out, std::string &err_msg);

// Two-space indented form with a trailing newline.
std::string to_pretty_string(const Json::Value &value);

bool write_json_file(const std::string &path, const Json::Value &value, std::string &err_msg);

}  // namespace jdiff

#endif  // __PROJECTS_JDIFF_SRC_JSON_IO_HPP_
