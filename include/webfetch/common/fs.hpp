#pragma once

#include "webfetch/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webfetch::common {

[[nodiscard]] std::string trim(std::string_view value);
[[nodiscard]] std::string to_lower(std::string_view value);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);
[[nodiscard]] std::vector<std::string> split_lines(std::string_view value);

/// Resolve the current user's home directory from $HOME or the passwd database.
[[nodiscard]] Result<std::filesystem::path> home_dir();

/// Expand a leading "~" and ${VAR} references.
[[nodiscard]] std::string expand_path(const std::string &path);

[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Locate an executable by name on $PATH. Absolute or relative paths are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &name);

} // namespace webfetch::common
