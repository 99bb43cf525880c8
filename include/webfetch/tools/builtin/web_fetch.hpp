#pragma once

#include "webfetch/config/schema.hpp"
#include "webfetch/pipeline/orchestrator.hpp"
#include "webfetch/tools/tool.hpp"

#include <memory>

namespace webfetch::tools {

class WebFetchTool final : public ITool {
public:
  WebFetchTool(std::shared_ptr<pipeline::Orchestrator> orchestrator,
               config::AnswererConfig answerer_config);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "web"; }

  /// Configured model, else the session model. Empty means no answerer.
  [[nodiscard]] std::optional<std::string> resolve_model(const ToolContext &ctx) const;
  [[nodiscard]] std::string resolve_thinking_level(const ToolContext &ctx) const;

private:
  std::shared_ptr<pipeline::Orchestrator> orchestrator_;
  config::AnswererConfig answerer_config_;
};

} // namespace webfetch::tools
