#pragma once

#include "webfetch/common/result.hpp"
#include "webfetch/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webfetch::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();

void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Apply WEBFETCH_* and PUPPETEER_EXECUTABLE_PATH environment overrides.
void apply_env_overrides(Config &config);

/// Load the config file. A missing file yields defaults; a malformed one is an error.
[[nodiscard]] common::Result<Config> load_config();

/// Load the config file, silently falling back to defaults when it is missing,
/// unreadable or malformed.
[[nodiscard]] Config load_config_or_default();

[[nodiscard]] common::Status save_config(const Config &config);

/// Returns hard errors as a failure, soft problems as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace webfetch::config
