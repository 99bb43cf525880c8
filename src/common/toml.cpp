#include "webfetch/common/toml.hpp"

#include <cctype>
#include <cstdint>
#include <optional>

namespace webfetch::common {

namespace {

class TomlParser {
public:
  explicit TomlParser(std::string_view text) : text_(text) {}

  Result<TomlDocument> run() {
    while (true) {
      skip_blank_lines();
      if (eof()) {
        break;
      }
      auto status = peek() == '[' ? parse_table_header() : parse_key_value();
      if (!status.ok()) {
        return Result<TomlDocument>::failure(status.error());
      }
      status = expect_line_end();
      if (!status.ok()) {
        return Result<TomlDocument>::failure(status.error());
      }
    }
    return Result<TomlDocument>::success(std::move(doc_));
  }

private:
  [[nodiscard]] bool eof() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek(std::size_t offset = 0) const {
    return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
  }

  void advance() {
    if (text_[pos_] == '\n') {
      ++line_;
    }
    ++pos_;
  }

  Status fail(const std::string &message) const {
    return Status::error("toml parse error at line " + std::to_string(line_) + ": " + message);
  }

  void skip_spaces() {
    while (!eof() && (peek() == ' ' || peek() == '\t')) {
      advance();
    }
  }

  void skip_comment() {
    if (peek() == '#') {
      while (!eof() && peek() != '\n') {
        advance();
      }
    }
  }

  void skip_blank_lines() {
    while (!eof()) {
      skip_spaces();
      skip_comment();
      if (peek() == '\r' || peek() == '\n') {
        advance();
        continue;
      }
      break;
    }
  }

  Status expect_line_end() {
    skip_spaces();
    skip_comment();
    if (peek() == '\r') {
      advance();
    }
    if (eof()) {
      return Status::success();
    }
    if (peek() != '\n') {
      return fail(std::string("unexpected character '") + peek() + "'");
    }
    advance();
    return Status::success();
  }

  Result<std::string> parse_key_part() {
    if (peek() == '"' || peek() == '\'') {
      return parse_string();
    }
    std::string key;
    while (!eof()) {
      const char ch = peek();
      if (std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-') {
        key.push_back(ch);
        advance();
      } else {
        break;
      }
    }
    if (key.empty()) {
      return Result<std::string>::failure(fail("expected key").error());
    }
    return Result<std::string>::success(std::move(key));
  }

  Result<std::string> parse_key_path() {
    std::string path;
    while (true) {
      skip_spaces();
      auto part = parse_key_part();
      if (!part.ok()) {
        return part;
      }
      if (!path.empty()) {
        path.push_back('.');
      }
      path += part.value();
      skip_spaces();
      if (peek() != '.') {
        break;
      }
      advance();
    }
    return Result<std::string>::success(std::move(path));
  }

  Status parse_table_header() {
    advance();
    if (peek() == '[') {
      return fail("arrays of tables are not supported");
    }
    auto path = parse_key_path();
    if (!path.ok()) {
      return Status::error(path.error());
    }
    if (peek() != ']') {
      return fail("expected ']' after table name");
    }
    advance();
    prefix_ = path.value() + ".";
    return Status::success();
  }

  Status parse_key_value() {
    auto key = parse_key_path();
    if (!key.ok()) {
      return Status::error(key.error());
    }
    skip_spaces();
    if (peek() != '=') {
      return fail("expected '=' after key '" + key.value() + "'");
    }
    advance();
    skip_spaces();
    auto value = parse_value();
    if (!value.ok()) {
      return Status::error(value.error());
    }
    const std::string full_key = prefix_ + key.value();
    if (doc_.has(full_key)) {
      return fail("duplicate key '" + full_key + "'");
    }
    doc_.set(full_key, std::move(value.value()));
    return Status::success();
  }

  Result<std::string> parse_string() {
    const char quote = peek();
    if (peek(1) == quote && peek(2) == quote) {
      return Result<std::string>::failure(fail("multi-line strings are not supported").error());
    }
    advance();
    std::string out;
    while (!eof()) {
      const char ch = peek();
      if (ch == '\n') {
        break;
      }
      if (ch == quote) {
        advance();
        return Result<std::string>::success(std::move(out));
      }
      if (quote == '"' && ch == '\\') {
        advance();
        const char esc = peek();
        switch (esc) {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case '"':
          out.push_back('"');
          break;
        case '\\':
          out.push_back('\\');
          break;
        default:
          return Result<std::string>::failure(
              fail(std::string("unsupported escape '\\") + esc + "'").error());
        }
        advance();
        continue;
      }
      out.push_back(ch);
      advance();
    }
    return Result<std::string>::failure(fail("unterminated string").error());
  }

  Result<TomlValue> parse_scalar() {
    if (peek() == '"' || peek() == '\'') {
      auto str = parse_string();
      if (!str.ok()) {
        return Result<TomlValue>::failure(str.error());
      }
      return Result<TomlValue>::success(std::move(str.value()));
    }

    std::string token;
    while (!eof()) {
      const char ch = peek();
      if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == ',' || ch == ']' ||
          ch == '#') {
        break;
      }
      token.push_back(ch);
      advance();
    }
    if (token == "true") {
      return Result<TomlValue>::success(true);
    }
    if (token == "false") {
      return Result<TomlValue>::success(false);
    }
    if (token.empty()) {
      return Result<TomlValue>::failure(fail("expected value").error());
    }

    std::string digits;
    for (const char ch : token) {
      if (ch != '_') {
        digits.push_back(ch);
      }
    }
    const bool is_float = digits.find_first_of(".eE") != std::string::npos;
    try {
      std::size_t consumed = 0;
      if (is_float) {
        const double value = std::stod(digits, &consumed);
        if (consumed == digits.size()) {
          return Result<TomlValue>::success(value);
        }
      } else {
        const long long value = std::stoll(digits, &consumed, 10);
        if (consumed == digits.size()) {
          return Result<TomlValue>::success(static_cast<std::int64_t>(value));
        }
      }
    } catch (const std::exception &) {
      // reported below
    }
    return Result<TomlValue>::failure(fail("invalid value '" + token + "'").error());
  }

  Result<TomlValue> parse_value() {
    if (peek() != '[') {
      return parse_scalar();
    }
    advance();
    std::vector<std::string> items;
    while (true) {
      skip_blank_lines();
      if (eof()) {
        return Result<TomlValue>::failure(fail("unterminated array").error());
      }
      if (peek() == ']') {
        advance();
        break;
      }
      auto item = parse_scalar();
      if (!item.ok()) {
        return item;
      }
      if (const auto *str = std::get_if<std::string>(&item.value())) {
        items.push_back(*str);
      } else if (const auto *integer = std::get_if<std::int64_t>(&item.value())) {
        items.push_back(std::to_string(*integer));
      } else if (const auto *flag = std::get_if<bool>(&item.value())) {
        items.emplace_back(*flag ? "true" : "false");
      } else if (const auto *number = std::get_if<double>(&item.value())) {
        items.push_back(std::to_string(*number));
      }
      skip_blank_lines();
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == ']') {
        advance();
        break;
      }
      return Result<TomlValue>::failure(fail("expected ',' or ']' in array").error());
    }
    return Result<TomlValue>::success(std::move(items));
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  int line_ = 1;
  std::string prefix_;
  TomlDocument doc_;
};

} // namespace

void TomlDocument::set(std::string key, TomlValue value) {
  values_[std::move(key)] = std::move(value);
}

bool TomlDocument::has(const std::string &key) const { return values_.count(key) > 0; }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &[key, value] : values_) {
    out.push_back(key);
  }
  return out;
}

std::string TomlDocument::get_string(const std::string &key,
                                     const std::string &default_value) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return default_value;
  }
  if (const auto *str = std::get_if<std::string>(&it->second)) {
    return *str;
  }
  return default_value;
}

bool TomlDocument::get_bool(const std::string &key, bool default_value) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return default_value;
  }
  if (const auto *flag = std::get_if<bool>(&it->second)) {
    return *flag;
  }
  return default_value;
}

std::int64_t TomlDocument::get_int(const std::string &key, std::int64_t default_value) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return default_value;
  }
  if (const auto *integer = std::get_if<std::int64_t>(&it->second)) {
    return *integer;
  }
  if (const auto *number = std::get_if<double>(&it->second)) {
    return static_cast<std::int64_t>(*number);
  }
  return default_value;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t default_value) const {
  const std::int64_t value = get_int(key, -1);
  if (value < 0) {
    return default_value;
  }
  return static_cast<std::uint64_t>(value);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &default_value) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return default_value;
  }
  if (const auto *items = std::get_if<std::vector<std::string>>(&it->second)) {
    return *items;
  }
  return default_value;
}

Result<TomlDocument> parse_toml(std::string_view text) { return TomlParser(text).run(); }

std::string quote_toml_string(std::string_view value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace webfetch::common
