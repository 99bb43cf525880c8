#pragma once

#include "webfetch/answer/runner.hpp"
#include "webfetch/browser/page_fetcher.hpp"
#include "webfetch/cache/response_cache.hpp"
#include "webfetch/common/result.hpp"
#include "webfetch/config/schema.hpp"
#include "webfetch/extract/extractor.hpp"
#include "webfetch/pipeline/orchestrator.hpp"
#include "webfetch/tools/builtin/web_fetch.hpp"

#include <memory>
#include <mutex>

namespace webfetch::runtime {

/// Stage overrides. Anything left empty is built from the config.
struct SessionOptions {
  std::shared_ptr<browser::IPageFetcher> fetcher;
  std::shared_ptr<extract::IContentExtractor> extractor;
  std::shared_ptr<answer::IAnswerRunner> answerer;
  extract::RunnerProbe probe;
  /// Leave the process-global observer alone.
  bool keep_global_observer = false;
};

class Session {
public:
  explicit Session(config::Config config, SessionOptions options = {});
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Init hook: starts the cache sweep and resolves the extraction runner.
  [[nodiscard]] common::Status start();
  /// Teardown hook: stops the sweep and drops cached content.
  void stop();
  [[nodiscard]] bool started() const;

  /// Null until start() succeeds.
  [[nodiscard]] std::shared_ptr<tools::WebFetchTool> web_fetch_tool() const;
  [[nodiscard]] std::shared_ptr<pipeline::Orchestrator> orchestrator() const;
  [[nodiscard]] cache::ResponseCache &cache() { return *cache_; }
  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  config::Config config_;
  SessionOptions options_;
  std::shared_ptr<cache::ResponseCache> cache_;

  mutable std::mutex mutex_;
  bool started_ = false;
  std::shared_ptr<pipeline::Orchestrator> orchestrator_;
  std::shared_ptr<tools::WebFetchTool> tool_;
};

} // namespace webfetch::runtime
