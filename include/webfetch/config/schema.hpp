#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace webfetch::config {

struct AnswererConfig {
  std::string command = "pi";
  std::optional<std::string> model;
  std::optional<std::string> thinking_level;
};

struct BrowserConfig {
  std::string executable;
  bool headless = true;
  bool no_sandbox = false;
  std::vector<std::string> extra_args;
  std::uint64_t page_timeout_secs = 30;
  std::uint64_t launch_timeout_secs = 15;
};

struct ExtractorConfig {
  std::string runner = "auto";
  std::string command;
  std::vector<std::string> args;
};

struct CacheConfig {
  std::uint64_t ttl_secs = 15 * 60;
  std::uint64_t sweep_interval_secs = 5 * 60;
};

struct PipelineConfig {
  std::size_t content_threshold = 50'000;
  std::size_t max_output_lines = 2000;
  std::size_t max_output_bytes = 50 * 1024;
};

struct ProcessConfig {
  std::uint64_t kill_grace_ms = 5000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  AnswererConfig answerer;
  BrowserConfig browser;
  ExtractorConfig extractor;
  CacheConfig cache;
  PipelineConfig pipeline;
  ProcessConfig process;
  ObservabilityConfig observability;
};

} // namespace webfetch::config
