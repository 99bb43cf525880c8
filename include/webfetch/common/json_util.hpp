#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace webfetch::common {

/// Top-level members of a JSON object. String values are unescaped; every other
/// value (numbers, literals, nested objects and arrays) is kept as raw JSON text.
using JsonMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] std::string json_escape(std::string_view value);
[[nodiscard]] std::string json_unescape(std::string_view value);

[[nodiscard]] std::size_t json_skip_ws(std::string_view json, std::size_t pos);

/// Index of the closing quote for the string opening at `open_quote`, or npos.
[[nodiscard]] std::size_t json_find_string_end(std::string_view json, std::size_t open_quote);

/// Index of the bracket closing the object/array opening at `open`, or npos.
[[nodiscard]] std::size_t json_find_matching_token(std::string_view json, std::size_t open);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] bool json_is_valid(std::string_view json);

[[nodiscard]] JsonMap json_parse_flat(std::string_view object_json);

[[nodiscard]] std::string json_get_string(std::string_view object_json, std::string_view key);
[[nodiscard]] std::string json_get_object(std::string_view object_json, std::string_view key);
[[nodiscard]] std::string json_get_array(std::string_view object_json, std::string_view key);
[[nodiscard]] std::string json_get_number(std::string_view object_json, std::string_view key);
[[nodiscard]] bool json_get_bool(std::string_view object_json, std::string_view key,
                                 bool default_value = false);
[[nodiscard]] std::vector<std::string> json_get_string_array(std::string_view object_json,
                                                             std::string_view key);

[[nodiscard]] std::vector<std::string> json_split_array(std::string_view array_json);
[[nodiscard]] std::vector<std::string>
json_split_top_level_objects(std::string_view array_json);

/// Serialize a flat map. Values that already look like JSON literals, numbers,
/// objects or arrays are emitted raw; everything else is quoted.
[[nodiscard]] std::string json_serialize_flat(const JsonMap &values);

} // namespace webfetch::common
