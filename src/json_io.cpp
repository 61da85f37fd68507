#include "json_io.hpp"

#include <json/reader.h>
#include <json/writer.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "logging.hpp"

#define RET_ERROR(_err_msg) \
    err_msg = _err_msg;     \
    return false;

namespace jdiff {

namespace {

Json::CharReaderBuilder make_reader_builder() {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = true;
    builder["allowSpecialFloats"] = false;
    return builder;
}

Json::StreamWriterBuilder make_writer_builder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["commentStyle"] = "None";
    builder["enableYAMLCompatibility"] = false;
    builder["emitUTF8"] = true;
    return builder;
}

}  // namespace

bool parse_json(const std::string &text, Json::Value &out, std::string &err_msg) {
    static const Json::CharReaderBuilder builder = make_reader_builder();
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    JSONCPP_STRING errs;
    if (!reader->parse(text.c_str(), text.c_str() + text.length(), &out, &errs)) {
        RET_ERROR("JSON parsing error : " + errs);
    }
    return true;
}

bool read_json_file(const std::string &path, Json::Value &out, std::string &err_msg) {
    std::ifstream file(path, std::ios_base::in | std::ios_base::binary);
    if (!file.is_open()) {
        RET_ERROR("Cannot open file : " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        RET_ERROR("Cannot read file : " + path);
    }
    DEBUG_LOG("read " << buffer.str().length() << " bytes from " << path);

    std::string parse_err;
    if (!parse_json(buffer.str(), out, parse_err)) {
        RET_ERROR(path + " : " + parse_err);
    }
    return true;
}

std::string to_pretty_string(const Json::Value &value) {
    static const Json::StreamWriterBuilder builder = make_writer_builder();
    return Json::writeString(builder, value) + "\n";
}

bool write_json_file(const std::string &path, const Json::Value &value, std::string &err_msg) {
    std::ofstream file(path, std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
    if (!file.is_open()) {
        RET_ERROR("Cannot write file : " + path);
    }

    file << to_pretty_string(value);
    file.flush();
    if (file.fail()) {
        RET_ERROR("Cannot write file : " + path);
    }
    DEBUG_LOG("wrote " << path);
    return true;
}

}  // namespace jdiff
