#include "webfetch/pipeline/decision.hpp"

#include <cstdio>

namespace webfetch::pipeline {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::size_t character_count(std::string_view text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

Decision decide(bool prompt_present, std::size_t content_length, bool answerer_available,
                std::size_t threshold) {
  if (prompt_present) {
    if (answerer_available) {
      return AnswerPrompt{};
    }
    return FallbackRaw{.note = "No model is configured for prompt processing (answerer "
                               "unavailable). Returning raw extracted content instead."};
  }
  if (content_length <= threshold) {
    return ReturnRaw{.truncate = false};
  }
  if (answerer_available) {
    return Summarize{};
  }
  return ReturnRaw{.truncate = true};
}

std::string_view decision_name(const Decision &decision) {
  return std::visit(overloaded{
                        [](const ReturnRaw &raw) -> std::string_view {
                          return raw.truncate ? "return_raw_truncated" : "return_raw";
                        },
                        [](const Summarize &) -> std::string_view { return "summarize"; },
                        [](const AnswerPrompt &) -> std::string_view { return "answer_prompt"; },
                        [](const FallbackRaw &) -> std::string_view { return "fallback_raw"; },
                    },
                    decision);
}

TruncationResult truncate_head(std::string_view content, std::size_t max_lines,
                               std::size_t max_bytes) {
  TruncationResult result;
  result.total_bytes = content.size();
  result.total_lines = 1;
  for (const char ch : content) {
    if (ch == '\n') {
      ++result.total_lines;
    }
  }

  if (result.total_lines <= max_lines && result.total_bytes <= max_bytes) {
    result.content = std::string(content);
    result.output_lines = result.total_lines;
    result.output_bytes = result.total_bytes;
    return result;
  }

  result.truncated = true;
  std::size_t kept_bytes = 0;
  std::size_t kept_lines = 0;
  std::size_t pos = 0;
  while (kept_lines < max_lines && pos <= content.size()) {
    const auto newline = content.find('\n', pos);
    const std::size_t end = newline == std::string_view::npos ? content.size() : newline;
    const std::size_t line_bytes = end - pos + (kept_lines > 0 ? 1 : 0);
    if (kept_bytes + line_bytes > max_bytes) {
      break;
    }
    kept_bytes += line_bytes;
    ++kept_lines;
    if (newline == std::string_view::npos) {
      break;
    }
    pos = newline + 1;
  }

  result.content = std::string(content.substr(0, kept_bytes));
  result.output_lines = kept_lines;
  result.output_bytes = kept_bytes;
  return result;
}

std::string format_size(std::size_t bytes) {
  char buffer[32];
  if (bytes < 1024) {
    std::snprintf(buffer, sizeof(buffer), "%zuB", bytes);
  } else if (bytes < 1024 * 1024) {
    std::snprintf(buffer, sizeof(buffer), "%.1fKB", static_cast<double>(bytes) / 1024.0);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.1fMB",
                  static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
  return buffer;
}

std::string render_truncated(const TruncationResult &truncation) {
  std::string text = truncation.content;
  if (truncation.truncated) {
    text += "\n\n[Output truncated: " + std::to_string(truncation.output_lines) + " of " +
            std::to_string(truncation.total_lines) + " lines (" +
            format_size(truncation.output_bytes) + " of " + format_size(truncation.total_bytes) +
            ")]";
  }
  return text;
}

const std::string &content_guardrails() {
  static const std::string text =
      "Respond concisely using only the page content above.\n"
      "- Keep direct quotes under 125 characters and always use quotation marks for exact "
      "wording.\n"
      "- Outside of quotes, rephrase in your own words and never reproduce source text "
      "verbatim.\n"
      "- Open-source code and documentation snippets are fine to include as-is.";
  return text;
}

const std::string &summarize_instruction() {
  static const std::string text =
      "Summarize this page:\n"
      "1. A 2-3 sentence overview of the page's purpose.\n"
      "2. For each major section or heading, its name and a 1-2 sentence description.\n"
      "3. End with: \"To extract specific information, call web_fetch again with the same URL "
      "and a prompt. The page is cached so re-fetching is instant.\"\n\n" +
      content_guardrails();
  return text;
}

std::string answer_instruction(const std::string &prompt) {
  return prompt + "\n\n" + content_guardrails();
}

} // namespace webfetch::pipeline
