#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace webfetch::pipeline {

inline constexpr std::size_t DEFAULT_CONTENT_THRESHOLD = 50'000;
inline constexpr std::size_t DEFAULT_MAX_LINES = 2000;
inline constexpr std::size_t DEFAULT_MAX_BYTES = 50 * 1024;

struct ReturnRaw {
  bool truncate = false;
};
struct Summarize {};
struct AnswerPrompt {};
struct FallbackRaw {
  std::string note;
};

using Decision = std::variant<ReturnRaw, Summarize, AnswerPrompt, FallbackRaw>;

/// Number of UTF-8 code points; continuation bytes are not counted.
[[nodiscard]] std::size_t character_count(std::string_view text);

/// Output strategy for extracted content. Pure.
[[nodiscard]] Decision decide(bool prompt_present, std::size_t content_length,
                              bool answerer_available,
                              std::size_t threshold = DEFAULT_CONTENT_THRESHOLD);

[[nodiscard]] std::string_view decision_name(const Decision &decision);

struct TruncationResult {
  std::string content;
  bool truncated = false;
  std::size_t total_lines = 0;
  std::size_t total_bytes = 0;
  std::size_t output_lines = 0;
  std::size_t output_bytes = 0;
};

/// Keep whole lines from the start until either limit would be exceeded.
[[nodiscard]] TruncationResult truncate_head(std::string_view content,
                                             std::size_t max_lines = DEFAULT_MAX_LINES,
                                             std::size_t max_bytes = DEFAULT_MAX_BYTES);

/// "512B", "1.5KB", "2.0MB".
[[nodiscard]] std::string format_size(std::size_t bytes);

/// Truncated content plus the "[Output truncated: ...]" footer when anything was cut.
[[nodiscard]] std::string render_truncated(const TruncationResult &truncation);

[[nodiscard]] const std::string &content_guardrails();
[[nodiscard]] const std::string &summarize_instruction();
[[nodiscard]] std::string answer_instruction(const std::string &prompt);

} // namespace webfetch::pipeline
