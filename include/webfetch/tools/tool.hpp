#pragma once

#include "webfetch/common/cancel.hpp"
#include "webfetch/common/result.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace webfetch::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolContext {
  std::filesystem::path workspace_path;
  /// Defaults used when the configuration names no answerer model or thinking level.
  std::string session_model;
  std::string session_thinking_level;
  std::shared_ptr<common::CancellationToken> cancel;
  std::function<void(const std::string &)> on_update;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;
  [[nodiscard]] virtual bool is_safe() const { return true; }
  [[nodiscard]] virtual std::string_view group() const { return "web"; }
};

/// Reads the string members of a flat JSON argument object.
[[nodiscard]] common::Result<ToolArgs> parse_tool_args(const std::string &json);

} // namespace webfetch::tools
