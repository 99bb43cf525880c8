#pragma once

#include "webfetch/common/cancel.hpp"
#include "webfetch/common/errors.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace webfetch::answer {

struct Answered {
  std::string text;
};

using AnswerOutcome = std::variant<Answered, common::StageFailure>;

struct AnswerRequest {
  std::string content;
  std::string instruction;
  std::string model;
  std::string thinking_level;
};

[[nodiscard]] std::string build_answer_prompt(const std::string &content,
                                              const std::string &instruction);

/// Arguments after the program name, prompt last.
[[nodiscard]] std::vector<std::string> build_answer_args(const AnswerRequest &request);

class IAnswerRunner {
public:
  virtual ~IAnswerRunner() = default;
  [[nodiscard]] virtual AnswerOutcome answer(const AnswerRequest &request,
                                             common::CancellationToken &cancel) = 0;
};

/// Runs the answering agent in json mode and keeps the last assistant message.
class AnswerRunner final : public IAnswerRunner {
public:
  AnswerRunner(std::string command, std::chrono::milliseconds kill_grace);

  [[nodiscard]] AnswerOutcome answer(const AnswerRequest &request,
                                     common::CancellationToken &cancel) override;

private:
  std::string command_;
  std::chrono::milliseconds kill_grace_;
};

} // namespace webfetch::answer
