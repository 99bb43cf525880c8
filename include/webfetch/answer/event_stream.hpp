#pragma once

#include <string>
#include <string_view>

namespace webfetch::answer {

/// Incremental parser for the answerer's newline-delimited JSON events. Keeps
/// the text of the most recent assistant message_end event that carried text.
class EventStreamParser {
public:
  void feed(std::string_view chunk);
  /// Parse whatever is left after the final newline.
  void finish();

  [[nodiscard]] const std::string &last_answer_text() const { return last_answer_text_; }
  [[nodiscard]] std::size_t events_seen() const { return events_seen_; }
  [[nodiscard]] std::size_t lines_skipped() const { return lines_skipped_; }

private:
  void process_line(std::string_view line);

  std::string buffer_;
  std::string last_answer_text_;
  std::size_t events_seen_ = 0;
  std::size_t lines_skipped_ = 0;
};

/// Text parts of an assistant message_end event, concatenated. `matched` is false
/// for every other event and for assistant events without a text part.
struct AssistantText {
  bool matched = false;
  std::string text;
};

[[nodiscard]] AssistantText assistant_text_of(std::string_view event_json);

} // namespace webfetch::answer
