#pragma once

#include "webfetch/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace webfetch::cli {

struct CliOptions {
  std::string url;
  std::optional<std::string> prompt;
  std::string model;
  std::string thinking_level;
  std::optional<std::string> config_path;
  bool help = false;
  bool version = false;
  bool check_config = false;
  bool quiet = false;
};

/// Parses everything after the program name.
[[nodiscard]] common::Result<CliOptions> parse_args(std::vector<std::string> args);

[[nodiscard]] std::string usage();

int run_cli(int argc, char **argv);

} // namespace webfetch::cli
