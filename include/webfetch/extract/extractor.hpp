#pragma once

#include "webfetch/common/cancel.hpp"
#include "webfetch/common/errors.hpp"
#include "webfetch/config/schema.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace webfetch::extract {

struct Extracted {
  std::string text;
};

using ExtractionOutcome = std::variant<Extracted, common::StageFailure>;

/// A resolved extraction invocation: `command args...`, markup on stdin.
struct ExtractorCommand {
  std::string label;
  std::string command;
  std::vector<std::string> args;
};

/// Python tool runners able to run trafilatura without a permanent install, in
/// priority order.
[[nodiscard]] const std::vector<ExtractorCommand> &python_runners();

/// Returns true when `command --version` exits 0 within the timeout.
using RunnerProbe = std::function<bool(const std::string &command)>;

[[nodiscard]] bool probe_runner(const std::string &command,
                                std::chrono::milliseconds timeout = std::chrono::seconds(5));

/// Pick the extraction command. An explicit runner or command in the config
/// skips probing; "auto" probes python_runners() in order.
[[nodiscard]] std::optional<ExtractorCommand> detect_extractor(const config::ExtractorConfig &config,
                                                               const RunnerProbe &probe);

class IContentExtractor {
public:
  virtual ~IContentExtractor() = default;
  [[nodiscard]] virtual ExtractionOutcome extract(const std::string &markup,
                                                  common::CancellationToken &cancel) = 0;
};

class ContentExtractor final : public IContentExtractor {
public:
  ContentExtractor(std::optional<ExtractorCommand> command, std::chrono::milliseconds kill_grace);

  [[nodiscard]] ExtractionOutcome extract(const std::string &markup,
                                          common::CancellationToken &cancel) override;

  [[nodiscard]] const std::optional<ExtractorCommand> &command() const { return command_; }

private:
  std::optional<ExtractorCommand> command_;
  std::chrono::milliseconds kill_grace_;
};

} // namespace webfetch::extract
