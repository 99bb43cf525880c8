#include "webfetch/tools/tool.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/common/json_util.hpp"

namespace webfetch::tools {

common::Result<ToolArgs> parse_tool_args(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty()) {
    return common::Result<ToolArgs>::success({});
  }
  if (trimmed.front() != '{' || !common::json_is_valid(trimmed)) {
    return common::Result<ToolArgs>::failure("tool arguments must be a JSON object");
  }
  ToolArgs args;
  for (auto &[key, value] : common::json_parse_flat(trimmed)) {
    args.emplace(key, value);
  }
  return common::Result<ToolArgs>::success(std::move(args));
}

} // namespace webfetch::tools
