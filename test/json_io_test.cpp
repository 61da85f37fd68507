#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "json_io.hpp"
#include "test_helpers.hpp"

namespace {

std::string slurp(const std::string &path) {
    std::ifstream f(path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(JsonIoTest, ParsesAnyRootValue) {
    const char *docs[] = {"null", "true", "-3", "2.5e3", "\"text\"", "[]", "{}", "[{\"a\": [null]}]"};
    for (const char *text : docs) {
        Json::Value value;
        std::string err_msg;
        EXPECT_TRUE(jdiff::parse_json(text, value, err_msg)) << text << ": " << err_msg;
        EXPECT_TRUE(err_msg.empty());
    }
}

TEST(JsonIoTest, RejectsInvalidDocuments) {
    const char *docs[] = {
        "",
        "{",
        "{\"a\": }",
        "[1, 2,",
        "{\"a\": 1} trailing",
        "// comment\n{}",
        "{\"dup\": 1, \"dup\": 2}",
        "NaN",
    };
    for (const char *text : docs) {
        Json::Value value;
        std::string err_msg;
        EXPECT_FALSE(jdiff::parse_json(text, value, err_msg)) << text;
        EXPECT_NE(err_msg.find("JSON parsing error"), std::string::npos) << text;
    }
}

TEST(JsonIoTest, ReadsFixtureFile) {
    Json::Value value;
    std::string err_msg;
    ASSERT_TRUE(jdiff::read_json_file(data_path("user1.json"), value, err_msg)) << err_msg;
    EXPECT_TRUE(value.isObject());
    EXPECT_EQ(value["name"].asString(), "Alice Martin");
}

TEST(JsonIoTest, MissingFileIsAnOpenError) {
    Json::Value value;
    std::string err_msg;
    const std::string path = data_path("does_not_exist.json");
    EXPECT_FALSE(jdiff::read_json_file(path, value, err_msg));
    EXPECT_EQ(err_msg, "Cannot open file : " + path);
}

TEST(JsonIoTest, InvalidFileIsAParseError) {
    Json::Value value;
    std::string err_msg;
    const std::string path = data_path("invalid.json");
    EXPECT_FALSE(jdiff::read_json_file(path, value, err_msg));
    EXPECT_EQ(err_msg.find(path), 0u);
    EXPECT_NE(err_msg.find("JSON parsing error"), std::string::npos);
}

TEST(JsonIoTest, PrettyStringIsIndentedAndTerminated) {
    EXPECT_EQ(jdiff::to_pretty_string(Json::Value(Json::nullValue)), "null\n");

    Json::Value value = parse("{\"b\": [1, 2], \"a\": \"x\"}");
    const std::string text = jdiff::to_pretty_string(value);
    EXPECT_EQ(text.find("{\n  \"a\""), 0u) << text;
    EXPECT_LT(text.find("\"a\""), text.find("\"b\""));
    EXPECT_EQ(text.substr(text.length() - 3), "\n}\n");
    EXPECT_EQ(parse(text), value);
}

TEST(JsonIoTest, PrettyStringKeepsUtf8) {
    Json::Value value = parse("{\"city\": \"Z\\u00fcrich\"}");
    EXPECT_NE(jdiff::to_pretty_string(value).find("Z\xc3\xbcrich"), std::string::npos);
}

TEST(JsonIoTest, WriteThenRead) {
    const std::string path = "json_io_test_output.json";
    Json::Value value = parse("{\"list\": [1, {\"k\": null}], \"s\": \"v\"}");

    std::string err_msg;
    ASSERT_TRUE(jdiff::write_json_file(path, value, err_msg)) << err_msg;
    EXPECT_EQ(slurp(path), jdiff::to_pretty_string(value));

    Json::Value back;
    ASSERT_TRUE(jdiff::read_json_file(path, back, err_msg)) << err_msg;
    EXPECT_EQ(back, value);

    std::remove(path.c_str());
}

TEST(JsonIoTest, UnwritablePathIsAWriteError) {
    const std::string path = "no_such_directory/out.json";
    std::string err_msg;
    EXPECT_FALSE(jdiff::write_json_file(path, Json::Value(1), err_msg));
    EXPECT_EQ(err_msg, "Cannot write file : " + path);
}
