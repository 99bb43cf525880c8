#include "webfetch/answer/event_stream.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/common/json_util.hpp"

namespace webfetch::answer {

AssistantText assistant_text_of(std::string_view event_json) {
  AssistantText out;
  if (common::json_get_string(event_json, "type") != "message_end") {
    return out;
  }
  const std::string message = common::json_get_object(event_json, "message");
  if (message.empty() || common::json_get_string(message, "role") != "assistant") {
    return out;
  }
  for (const auto &part : common::json_split_top_level_objects(
           common::json_get_array(message, "content"))) {
    if (common::json_get_string(part, "type") == "text") {
      out.matched = true;
      out.text += common::json_get_string(part, "text");
    }
  }
  return out;
}

void EventStreamParser::feed(std::string_view chunk) {
  buffer_.append(chunk);
  std::size_t start = 0;
  while (true) {
    const auto newline = buffer_.find('\n', start);
    if (newline == std::string::npos) {
      break;
    }
    process_line(std::string_view(buffer_).substr(start, newline - start));
    start = newline + 1;
  }
  buffer_.erase(0, start);
}

void EventStreamParser::finish() {
  if (!buffer_.empty()) {
    const std::string rest = std::move(buffer_);
    buffer_.clear();
    process_line(rest);
  }
}

void EventStreamParser::process_line(std::string_view line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty()) {
    return;
  }
  if (!common::json_is_valid(trimmed) || trimmed.front() != '{') {
    ++lines_skipped_;
    return;
  }
  ++events_seen_;
  auto assistant = assistant_text_of(trimmed);
  if (assistant.matched) {
    last_answer_text_ = std::move(assistant.text);
  }
}

} // namespace webfetch::answer
