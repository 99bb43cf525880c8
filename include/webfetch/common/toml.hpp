#pragma once

#include "webfetch/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace webfetch::common {

using TomlValue =
    std::variant<std::string, std::int64_t, double, bool, std::vector<std::string>>;

/// Flattened TOML document. Keys are full dotted paths ("browser.page_timeout_secs").
class TomlDocument {
public:
  void set(std::string key, TomlValue value);

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &default_value = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool default_value) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t default_value) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key,
                                      std::uint64_t default_value) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key,
                   const std::vector<std::string> &default_value = {}) const;

private:
  std::map<std::string, TomlValue> values_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(std::string_view text);

[[nodiscard]] std::string quote_toml_string(std::string_view value);

} // namespace webfetch::common
