#include "test_framework.hpp"

#include "webfetch/common/json_util.hpp"
#include "webfetch/common/toml.hpp"
#include "webfetch/tools/tool.hpp"

void register_json_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;
  namespace c = webfetch::common;

  tests.push_back({"json_parse_flat_keeps_nested_raw", [] {
                     const auto map = c::json_parse_flat(
                         R"({"name":"a\"b","count":3,"inner":{"x":[1,2]},"flag":true})");
                     require(map.at("name") == "a\"b", "string value should be unescaped");
                     require(map.at("count") == "3", "number should be raw");
                     require(map.at("inner") == R"({"x":[1,2]})", "object should be raw");
                     require(map.at("flag") == "true", "literal should be raw");
                   }});

  tests.push_back({"json_escape_and_unescape", [] {
                     const std::string text = "line1\nline2\t\"quoted\" \\ end";
                     require(c::json_unescape(c::json_escape(text)) == text,
                             "escape/unescape mismatch");
                     require(c::json_unescape("\\u00e9\\ud83d\\ude00") == "\xC3\xA9\xF0\x9F\x98\x80",
                             "unicode escapes should decode to utf-8");
                   }});

  tests.push_back({"json_validity_check", [] {
                     require(c::json_is_valid(R"({"a":[1,2,{"b":null}]})"), "valid object");
                     require(c::json_is_valid("\"text\""), "valid string document");
                     require(!c::json_is_valid(R"({"a":1,})"), "trailing comma is invalid");
                     require(!c::json_is_valid("{\"a\":1} extra"), "trailing data is invalid");
                     require(!c::json_is_valid(""), "empty input is invalid");
                   }});

  tests.push_back({"json_get_helpers", [] {
                     const std::string json =
                         R"({"message":{"role":"assistant","content":[{"type":"text","text":"hi"}]},"n":-1.5e2,"ok":false,"tags":["a","b",3]})";
                     require(c::json_get_string(c::json_get_object(json, "message"), "role") ==
                                 "assistant",
                             "nested string lookup");
                     require(c::json_split_top_level_objects(
                                 c::json_get_array(c::json_get_object(json, "message"), "content"))
                                     .size() == 1,
                             "content should hold one object");
                     require(c::json_get_number(json, "n") == "-1.5e2", "number lookup");
                     require(!c::json_get_bool(json, "ok", true), "bool lookup");
                     const auto tags = c::json_get_string_array(json, "tags");
                     require(tags.size() == 2 && tags[1] == "b", "string array skips non-strings");
                     require(c::json_get_string(json, "missing").empty(), "missing key is empty");
                   }});

  tests.push_back({"toml_parse_sections_and_arrays", [] {
                     const auto parsed = c::parse_toml(R"(
model = "top"
[browser]
no_sandbox = true # trailing comment
extra_args = ["--lang=en", "--window-size=1280,800"]
page_timeout_secs = 45
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("model") == "top", "top-level key");
                     require(doc.get_bool("browser.no_sandbox", false), "bool key");
                     const auto args = doc.get_string_array("browser.extra_args");
                     require(args.size() == 2 && args[1] == "--window-size=1280,800",
                             "string array");
                     require(doc.get_u64("browser.page_timeout_secs", 0) == 45, "integer key");
                   }});

  tests.push_back({"toml_rejects_malformed_lines", [] {
                     require(!c::parse_toml("[browser\nx = 1").ok(), "unterminated table");
                     require(!c::parse_toml("key = \"unterminated").ok(),
                             "unterminated string");
                   }});

  tests.push_back({"tool_args_parse_json_object", [] {
                     const auto args = webfetch::tools::parse_tool_args(
                         R"({"url":"https://example.com","prompt":"What is it?"})");
                     require(args.ok(), args.error());
                     require(args.value().at("url") == "https://example.com", "url arg");
                     require(args.value().at("prompt") == "What is it?", "prompt arg");
                     require(!webfetch::tools::parse_tool_args("[1,2]").ok(),
                             "arrays are rejected");
                     require(!webfetch::tools::parse_tool_args("{\"url\":").ok(),
                             "malformed json is rejected");
                   }});
}
