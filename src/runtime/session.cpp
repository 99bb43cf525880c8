#include "webfetch/runtime/session.hpp"

#include "webfetch/browser/chrome.hpp"
#include "webfetch/observability/factory.hpp"
#include "webfetch/observability/global.hpp"

namespace webfetch::runtime {

Session::Session(config::Config config, SessionOptions options)
    : config_(std::move(config)), options_(std::move(options)),
      cache_(std::make_shared<cache::ResponseCache>(
          std::chrono::seconds(config_.cache.ttl_secs),
          std::chrono::seconds(config_.cache.sweep_interval_secs))) {}

Session::~Session() { stop(); }

common::Status Session::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return common::Status::success();
  }

  if (!options_.keep_global_observer) {
    observability::set_global_observer(observability::create_observer(config_));
  }

  const auto kill_grace = std::chrono::milliseconds(config_.process.kill_grace_ms);

  std::shared_ptr<browser::IPageFetcher> fetcher = options_.fetcher;
  if (!fetcher) {
    auto launcher = std::make_shared<browser::ChromeLauncher>(config_.browser, kill_grace);
    fetcher = std::make_shared<browser::PageFetcher>(
        std::move(launcher), std::chrono::seconds(config_.browser.page_timeout_secs));
  }

  std::shared_ptr<extract::IContentExtractor> extractor = options_.extractor;
  if (!extractor) {
    extract::RunnerProbe probe = options_.probe;
    if (!probe) {
      probe = [](const std::string &command) { return extract::probe_runner(command); };
    }
    auto command = extract::detect_extractor(config_.extractor, probe);
    if (command.has_value()) {
      observability::record_event("session", "extraction runner: " + command->label);
    } else {
      observability::record_error("session", "no Python tool runner found");
    }
    extractor = std::make_shared<extract::ContentExtractor>(std::move(command), kill_grace);
  }

  std::shared_ptr<answer::IAnswerRunner> answerer = options_.answerer;
  if (!answerer) {
    answerer = std::make_shared<answer::AnswerRunner>(config_.answerer.command, kill_grace);
  }

  orchestrator_ = std::make_shared<pipeline::Orchestrator>(
      cache_, std::move(fetcher), std::move(extractor), std::move(answerer), config_.pipeline);
  tool_ = std::make_shared<tools::WebFetchTool>(orchestrator_, config_.answerer);

  cache_->start();
  started_ = true;
  observability::record_event("session", "started");
  return common::Status::success();
}

void Session::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!started_) {
    return;
  }
  cache_->stop();
  started_ = false;
  observability::record_event("session", "stopped");
}

bool Session::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

std::shared_ptr<tools::WebFetchTool> Session::web_fetch_tool() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tool_;
}

std::shared_ptr<pipeline::Orchestrator> Session::orchestrator() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return orchestrator_;
}

} // namespace webfetch::runtime
