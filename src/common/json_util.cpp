#include "webfetch/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>

namespace webfetch::common {

namespace {

constexpr int MAX_NESTING_DEPTH = 512;

bool is_ws(char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(std::string_view value, std::size_t pos) {
  if (pos + 4 > value.size()) {
    return std::nullopt;
  }
  std::uint32_t cp = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = value[i];
    cp <<= 4;
    if (ch >= '0' && ch <= '9') {
      cp |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      cp |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      cp |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return cp;
}

bool looks_like_number(std::string_view value) {
  std::size_t i = 0;
  if (i < value.size() && value[i] == '-') {
    ++i;
  }
  const std::size_t int_start = i;
  while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i])) != 0) {
    ++i;
  }
  if (i == int_start) {
    return false;
  }
  if (value[int_start] == '0' && i - int_start > 1) {
    return false;
  }
  if (i < value.size() && value[i] == '.') {
    ++i;
    const std::size_t frac_start = i;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i])) != 0) {
      ++i;
    }
    if (i == frac_start) {
      return false;
    }
  }
  if (i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
    ++i;
    if (i < value.size() && (value[i] == '+' || value[i] == '-')) {
      ++i;
    }
    const std::size_t exp_start = i;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i])) != 0) {
      ++i;
    }
    if (i == exp_start) {
      return false;
    }
  }
  return i == value.size();
}

class Validator {
public:
  explicit Validator(std::string_view json) : json_(json) {}

  bool run() {
    skip();
    if (!value()) {
      return false;
    }
    skip();
    return pos_ == json_.size();
  }

private:
  void skip() { pos_ = json_skip_ws(json_, pos_); }

  bool value() {
    if (pos_ >= json_.size()) {
      return false;
    }
    switch (json_[pos_]) {
    case '{':
      return object();
    case '[':
      return array();
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      return number();
    }
  }

  bool literal(std::string_view word) {
    if (json_.substr(pos_, word.size()) != word) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool number() {
    std::size_t end = pos_;
    while (end < json_.size() && !is_ws(json_[end]) && json_[end] != ',' && json_[end] != ']' &&
           json_[end] != '}') {
      ++end;
    }
    if (!looks_like_number(json_.substr(pos_, end - pos_))) {
      return false;
    }
    pos_ = end;
    return true;
  }

  bool string() {
    ++pos_;
    while (pos_ < json_.size()) {
      const auto ch = static_cast<unsigned char>(json_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch == '\\') {
        if (pos_ + 1 >= json_.size()) {
          return false;
        }
        const char esc = json_[pos_ + 1];
        if (esc == 'u') {
          if (!parse_hex4(json_, pos_ + 2).has_value()) {
            return false;
          }
          pos_ += 6;
          continue;
        }
        if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' &&
            esc != 'n' && esc != 'r' && esc != 't') {
          return false;
        }
        pos_ += 2;
        continue;
      }
      ++pos_;
    }
    return false;
  }

  bool object() {
    if (++depth_ > MAX_NESTING_DEPTH) {
      return false;
    }
    ++pos_;
    skip();
    if (pos_ < json_.size() && json_[pos_] == '}') {
      ++pos_;
      --depth_;
      return true;
    }
    while (pos_ < json_.size()) {
      if (json_[pos_] != '"' || !string()) {
        return false;
      }
      skip();
      if (pos_ >= json_.size() || json_[pos_] != ':') {
        return false;
      }
      ++pos_;
      skip();
      if (!value()) {
        return false;
      }
      skip();
      if (pos_ < json_.size() && json_[pos_] == ',') {
        ++pos_;
        skip();
        continue;
      }
      if (pos_ < json_.size() && json_[pos_] == '}') {
        ++pos_;
        --depth_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool array() {
    if (++depth_ > MAX_NESTING_DEPTH) {
      return false;
    }
    ++pos_;
    skip();
    if (pos_ < json_.size() && json_[pos_] == ']') {
      ++pos_;
      --depth_;
      return true;
    }
    while (pos_ < json_.size()) {
      if (!value()) {
        return false;
      }
      skip();
      if (pos_ < json_.size() && json_[pos_] == ',') {
        ++pos_;
        skip();
        continue;
      }
      if (pos_ < json_.size() && json_[pos_] == ']') {
        ++pos_;
        --depth_;
        return true;
      }
      return false;
    }
    return false;
  }

  std::string_view json_;
  std::size_t pos_ = 0;
  int depth_ = 0;
};

// End (exclusive) of the value starting at `pos`, or npos when malformed.
std::size_t value_end(std::string_view json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string_view::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string_view::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos);
    return end == std::string_view::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && !is_ws(json[end]) && json[end] != ',' && json[end] != '}' &&
         json[end] != ']') {
    ++end;
  }
  return end;
}

using MemberVisitor = std::function<bool(const std::string &key, std::string_view raw)>;

void for_each_member(std::string_view json, const MemberVisitor &visit) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return;
  }
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != '"') {
      return;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string_view::npos) {
      return;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == std::string_view::npos) {
      return;
    }
    if (!visit(key, json.substr(pos, end - pos))) {
      return;
    }
    pos = json_skip_ws(json, end);
    if (pos < json.size() && json[pos] == ',') {
      ++pos;
      continue;
    }
    return;
  }
}

std::optional<std::string_view> find_member(std::string_view json, std::string_view key) {
  std::optional<std::string_view> found;
  for_each_member(json, [&](const std::string &member, std::string_view raw) {
    if (member == key) {
      found = raw;
      return false;
    }
    return true;
  });
  return found;
}

std::string decode_value(std::string_view raw) {
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    return json_unescape(raw.substr(1, raw.size() - 2));
  }
  return std::string(raw);
}

} // namespace

std::string json_escape(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        out += "\\u00";
        out.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        out.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

std::string json_unescape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 1 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = value[++i];
    switch (esc) {
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    case '/':
      out.push_back('/');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      auto cp = parse_hex4(value, i + 1);
      if (!cp.has_value()) {
        out += "\\u";
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < value.size() &&
          value[i + 1] == '\\' && value[i + 2] == 'u') {
        const auto low = parse_hex4(value, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      if (code >= 0xD800 && code <= 0xDFFF) {
        code = 0xFFFD;
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(std::string_view json, std::size_t pos) {
  while (pos < json.size() && is_ws(json[pos])) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(std::string_view json, std::size_t open_quote) {
  for (std::size_t i = open_quote + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string_view::npos;
}

std::size_t json_find_matching_token(std::string_view json, std::size_t open) {
  if (open >= json.size() || (json[open] != '{' && json[open] != '[')) {
    return std::string_view::npos;
  }
  int depth = 0;
  for (std::size_t i = open; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = json_find_string_end(json, i);
      if (i == std::string_view::npos) {
        return i;
      }
      continue;
    }
    if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

bool json_is_valid(std::string_view json) { return Validator(json).run(); }

JsonMap json_parse_flat(std::string_view object_json) {
  JsonMap out;
  for_each_member(object_json, [&](const std::string &key, std::string_view raw) {
    out[key] = decode_value(raw);
    return true;
  });
  return out;
}

std::string json_get_string(std::string_view object_json, std::string_view key) {
  const auto raw = find_member(object_json, key);
  if (!raw.has_value() || *raw == "null") {
    return "";
  }
  return decode_value(*raw);
}

std::string json_get_object(std::string_view object_json, std::string_view key) {
  const auto raw = find_member(object_json, key);
  if (!raw.has_value() || raw->empty() || raw->front() != '{') {
    return "";
  }
  return std::string(*raw);
}

std::string json_get_array(std::string_view object_json, std::string_view key) {
  const auto raw = find_member(object_json, key);
  if (!raw.has_value() || raw->empty() || raw->front() != '[') {
    return "";
  }
  return std::string(*raw);
}

std::string json_get_number(std::string_view object_json, std::string_view key) {
  const auto raw = find_member(object_json, key);
  if (!raw.has_value() || !looks_like_number(*raw)) {
    return "";
  }
  return std::string(*raw);
}

bool json_get_bool(std::string_view object_json, std::string_view key, bool default_value) {
  const auto raw = find_member(object_json, key);
  if (!raw.has_value()) {
    return default_value;
  }
  if (*raw == "true") {
    return true;
  }
  if (*raw == "false") {
    return false;
  }
  return default_value;
}

std::vector<std::string> json_get_string_array(std::string_view object_json,
                                               std::string_view key) {
  std::vector<std::string> out;
  for (const auto &item : json_split_array(json_get_array(object_json, key))) {
    if (!item.empty() && item.front() == '"') {
      out.push_back(decode_value(item));
    }
  }
  return out;
}

std::vector<std::string> json_split_array(std::string_view array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      return out;
    }
    const auto end = value_end(array_json, pos);
    if (end == std::string_view::npos || end == pos) {
      return out;
    }
    out.emplace_back(array_json.substr(pos, end - pos));
    pos = json_skip_ws(array_json, end);
    if (pos < array_json.size() && array_json[pos] == ',') {
      ++pos;
      continue;
    }
    return out;
  }
}

std::vector<std::string> json_split_top_level_objects(std::string_view array_json) {
  std::vector<std::string> out;
  for (auto &item : json_split_array(array_json)) {
    if (!item.empty() && item.front() == '{') {
      out.push_back(std::move(item));
    }
  }
  return out;
}

std::string json_serialize_flat(const JsonMap &values) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << json_escape(key) << "\":";
    const bool raw = value == "true" || value == "false" || value == "null" ||
                     looks_like_number(value) ||
                     ((!value.empty() && (value.front() == '{' || value.front() == '[')) &&
                      json_is_valid(value));
    if (raw) {
      out << value;
    } else {
      out << '"' << json_escape(value) << '"';
    }
  }
  out << '}';
  return out.str();
}

} // namespace webfetch::common
