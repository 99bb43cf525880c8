#include "webfetch/tools/builtin/web_fetch.hpp"

#include "webfetch/common/fs.hpp"

namespace webfetch::tools {

WebFetchTool::WebFetchTool(std::shared_ptr<pipeline::Orchestrator> orchestrator,
                           config::AnswererConfig answerer_config)
    : orchestrator_(std::move(orchestrator)), answerer_config_(std::move(answerer_config)) {}

std::string_view WebFetchTool::name() const { return "web_fetch"; }

std::string_view WebFetchTool::description() const {
  return "Fetch a web page and return its main content as markdown. The page is rendered in a "
         "headless browser, so JavaScript-heavy sites work. Providing a prompt is recommended: "
         "the page is then processed by a small model and only the requested information is "
         "returned. Without a prompt, large pages are summarized. For GitHub URLs prefer the gh "
         "CLI. HTTP URLs are upgraded to HTTPS. Results are cached for 15 minutes. Redirects to a "
         "different host are reported instead of followed. This tool does not modify any files.";
}

std::string WebFetchTool::parameters_schema() const {
  return R"json({"type":"object","required":["url"],"properties":{"url":{"type":"string","description":"Fully-formed URL to fetch (e.g., https://example.com/page)"},"prompt":{"type":"string","description":"What information to extract from the page. When omitted, the full content is returned (or summarized if large)."}}})json";
}

std::optional<std::string> WebFetchTool::resolve_model(const ToolContext &ctx) const {
  if (answerer_config_.model.has_value() && !common::trim(*answerer_config_.model).empty()) {
    return common::trim(*answerer_config_.model);
  }
  if (!common::trim(ctx.session_model).empty()) {
    return common::trim(ctx.session_model);
  }
  return std::nullopt;
}

std::string WebFetchTool::resolve_thinking_level(const ToolContext &ctx) const {
  if (answerer_config_.thinking_level.has_value() &&
      !common::trim(*answerer_config_.thinking_level).empty()) {
    return common::trim(*answerer_config_.thinking_level);
  }
  return common::trim(ctx.session_thinking_level);
}

common::Result<ToolResult> WebFetchTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto url_it = args.find("url");
  if (url_it == args.end() || common::trim(url_it->second).empty()) {
    return common::Result<ToolResult>::failure("Missing url");
  }

  pipeline::FetchRequest request;
  request.url = url_it->second;
  if (const auto prompt_it = args.find("prompt"); prompt_it != args.end()) {
    request.prompt = prompt_it->second;
  }
  request.model = resolve_model(ctx);
  request.thinking_level = resolve_thinking_level(ctx);

  std::shared_ptr<common::CancellationToken> cancel = ctx.cancel;
  if (!cancel) {
    cancel = std::make_shared<common::CancellationToken>();
  }

  const pipeline::FetchResponse response = orchestrator_->run(request, *cancel, ctx.on_update);

  ToolResult result;
  result.success = !response.is_error;
  result.output = response.text;
  result.truncated = response.truncated;
  result.metadata["url"] = request.url;
  result.metadata["cached"] = response.from_cache ? "true" : "false";
  if (response.error_kind.has_value()) {
    result.metadata["error_kind"] = std::string(common::error_kind_to_string(*response.error_kind));
  }
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace webfetch::tools
