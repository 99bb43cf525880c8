#pragma once

#include "webfetch/answer/runner.hpp"
#include "webfetch/browser/page_fetcher.hpp"
#include "webfetch/cache/response_cache.hpp"
#include "webfetch/common/cancel.hpp"
#include "webfetch/common/errors.hpp"
#include "webfetch/config/schema.hpp"
#include "webfetch/extract/extractor.hpp"
#include "webfetch/pipeline/decision.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace webfetch::pipeline {

/// Fire-and-forget progress notification.
using ProgressCallback = std::function<void(const std::string &message)>;

struct FetchRequest {
  std::string url;
  std::optional<std::string> prompt;
  /// Resolved answerer model. Without one the answerer is unavailable.
  std::optional<std::string> model;
  std::string thinking_level;
};

struct FetchResponse {
  std::string text;
  bool is_error = false;
  std::optional<common::ErrorKind> error_kind;
  bool from_cache = false;
  /// Raw content in `text` was cut to the output limits.
  bool truncated = false;
};

class Orchestrator {
public:
  Orchestrator(std::shared_ptr<cache::ResponseCache> cache,
               std::shared_ptr<browser::IPageFetcher> fetcher,
               std::shared_ptr<extract::IContentExtractor> extractor,
               std::shared_ptr<answer::IAnswerRunner> answerer,
               config::PipelineConfig config = {});

  [[nodiscard]] FetchResponse run(const FetchRequest &request, common::CancellationToken &cancel,
                                  const ProgressCallback &progress = {});

private:
  [[nodiscard]] FetchResponse process_content(const std::string &content,
                                              const FetchRequest &request,
                                              common::CancellationToken &cancel,
                                              const ProgressCallback &progress);
  /// Raw content cut to the output limits, followed by `note` when one is given.
  [[nodiscard]] FetchResponse raw_response(const std::string &content, bool truncate,
                                           const std::string &note = {}) const;

  std::shared_ptr<cache::ResponseCache> cache_;
  std::shared_ptr<browser::IPageFetcher> fetcher_;
  std::shared_ptr<extract::IContentExtractor> extractor_;
  std::shared_ptr<answer::IAnswerRunner> answerer_;
  config::PipelineConfig config_;
};

} // namespace webfetch::pipeline
