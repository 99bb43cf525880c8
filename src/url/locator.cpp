#include "webfetch/url/locator.hpp"

#include "webfetch/common/fs.hpp"

#include <cctype>
#include <utility>
#include <string_view>

namespace webfetch::url {

namespace {

constexpr std::string_view FORBIDDEN_HOST_CHARS = " #%/:<>?@[\\]^|";

bool is_special(std::string_view scheme) { return scheme == "http" || scheme == "https"; }

std::optional<std::pair<std::string, std::string_view>> split_scheme(std::string_view text) {
  if (text.empty() || std::isalpha(static_cast<unsigned char>(text.front())) == 0) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == ':') {
      return std::make_pair(common::to_lower(text.substr(0, i)), text.substr(i + 1));
    }
    if (std::isalnum(c) == 0 && c != '+' && c != '-' && c != '.') {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

bool encode_in_path(unsigned char c) {
  return c <= 0x20 || c >= 0x7f || c == '"' || c == '<' || c == '>' || c == '`' || c == '{' ||
         c == '}';
}

bool encode_in_query(unsigned char c) {
  return c <= 0x20 || c >= 0x7f || c == '"' || c == '<' || c == '>' || c == '\'';
}

bool encode_in_fragment(unsigned char c) {
  return c <= 0x20 || c >= 0x7f || c == '"' || c == '<' || c == '>' || c == '`';
}

std::string percent_encode(std::string_view value, bool (*should_encode)(unsigned char)) {
  static constexpr char HEX[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (should_encode(c)) {
      out.push_back('%');
      out.push_back(HEX[c >> 4]);
      out.push_back(HEX[c & 0x0f]);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

void pop_segment(std::string &output) {
  const auto slash = output.rfind('/');
  output.erase(slash == std::string::npos ? 0 : slash);
}

std::string remove_dot_segments(std::string_view path) {
  std::string input(path);
  std::string output;
  while (!input.empty()) {
    if (common::starts_with(input, "../")) {
      input.erase(0, 3);
    } else if (common::starts_with(input, "./")) {
      input.erase(0, 2);
    } else if (common::starts_with(input, "/./")) {
      input.erase(0, 2);
    } else if (input == "/.") {
      input = "/";
    } else if (common::starts_with(input, "/../")) {
      input.erase(0, 3);
      pop_segment(output);
    } else if (input == "/..") {
      input = "/";
      pop_segment(output);
    } else if (input == "." || input == "..") {
      input.clear();
    } else {
      const std::size_t next = input.find('/', input.front() == '/' ? 1 : 0);
      const std::size_t len = next == std::string::npos ? input.size() : next;
      output.append(input, 0, len);
      input.erase(0, len);
    }
  }
  return output;
}

struct ReferenceParts {
  std::string_view path;
  std::optional<std::string_view> query;
  std::optional<std::string_view> fragment;
};

ReferenceParts split_reference(std::string_view text) {
  ReferenceParts parts;
  if (const auto hash = text.find('#'); hash != std::string_view::npos) {
    parts.fragment = text.substr(hash + 1);
    text = text.substr(0, hash);
  }
  if (const auto question = text.find('?'); question != std::string_view::npos) {
    parts.query = text.substr(question + 1);
    text = text.substr(0, question);
  }
  parts.path = text;
  return parts;
}

std::string authority_prefix(const Url &url) {
  std::string out = url.scheme + "://";
  if (!url.userinfo.empty()) {
    out += url.userinfo + "@";
  }
  out += url.host;
  if (url.port.has_value()) {
    out += ":" + std::to_string(*url.port);
  }
  return out;
}

} // namespace

std::string Url::serialize() const {
  std::string out = authority_prefix(*this);
  out += path.empty() ? "/" : path;
  if (query.has_value()) {
    out += "?" + *query;
  }
  if (fragment.has_value()) {
    out += "#" + *fragment;
  }
  return out;
}

std::optional<std::uint16_t> default_port(std::string_view scheme) {
  if (scheme == "http") {
    return 80;
  }
  if (scheme == "https") {
    return 443;
  }
  return std::nullopt;
}

common::Result<Url> parse_url(std::string_view text) {
  const std::string trimmed = common::trim(text);
  const auto scheme_split = split_scheme(trimmed);
  if (!scheme_split.has_value()) {
    return common::Result<Url>::failure("missing scheme");
  }

  Url url;
  url.scheme = scheme_split->first;
  std::string_view rest = scheme_split->second;
  const bool special = is_special(url.scheme);

  std::size_t pos = 0;
  if (special) {
    while (pos < rest.size() && (rest[pos] == '/' || rest[pos] == '\\')) {
      ++pos;
    }
  } else if (common::starts_with(rest, "//")) {
    pos = 2;
  } else {
    return common::Result<Url>::failure("missing authority");
  }

  const std::string_view delimiters = special ? "/?#\\" : "/?#";
  std::size_t end = rest.find_first_of(delimiters, pos);
  if (end == std::string_view::npos) {
    end = rest.size();
  }
  std::string_view authority = rest.substr(pos, end - pos);

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    url.userinfo = std::string(authority.substr(0, at));
    authority = authority.substr(at + 1);
  }

  std::string_view host = authority;
  std::string_view port;
  if (common::starts_with(authority, "[")) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return common::Result<Url>::failure("unterminated IPv6 host");
    }
    host = authority.substr(0, close + 1);
    const std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return common::Result<Url>::failure("invalid host");
      }
      port = after.substr(1);
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  if (host.empty()) {
    return common::Result<Url>::failure("missing host");
  }
  if (host.front() != '[') {
    for (const char ch : host) {
      const auto c = static_cast<unsigned char>(ch);
      if (c < 0x20 || c == 0x7f || FORBIDDEN_HOST_CHARS.find(ch) != std::string_view::npos) {
        return common::Result<Url>::failure("invalid host");
      }
    }
  }
  url.host = common::to_lower(host);

  if (!port.empty()) {
    if (port.size() > 5) {
      return common::Result<Url>::failure("invalid port");
    }
    std::uint32_t value = 0;
    for (const char ch : port) {
      if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
        return common::Result<Url>::failure("invalid port");
      }
      value = value * 10 + static_cast<std::uint32_t>(ch - '0');
    }
    if (value > 65535) {
      return common::Result<Url>::failure("invalid port");
    }
    url.port = static_cast<std::uint16_t>(value);
    if (url.port == default_port(url.scheme)) {
      url.port.reset();
    }
  }

  const ReferenceParts parts = split_reference(rest.substr(end));
  std::string path(parts.path);
  if (special) {
    for (auto &ch : path) {
      if (ch == '\\') {
        ch = '/';
      }
    }
  }
  if (path.empty()) {
    path = "/";
  }
  url.path = percent_encode(remove_dot_segments(path), encode_in_path);
  if (url.path.empty()) {
    url.path = "/";
  }
  if (parts.query.has_value()) {
    url.query = percent_encode(*parts.query, encode_in_query);
  }
  if (parts.fragment.has_value()) {
    url.fragment = percent_encode(*parts.fragment, encode_in_fragment);
  }
  return common::Result<Url>::success(std::move(url));
}

common::Result<std::string> normalize_locator(std::string_view input) {
  std::string cleaned = common::trim(input);
  if (common::starts_with(cleaned, "@")) {
    cleaned = common::trim(std::string_view(cleaned).substr(1));
  }

  const std::string invalid = "Invalid URL: \"" + cleaned +
                              "\". Please provide a fully-formed URL (e.g., "
                              "https://example.com/page).";
  if (cleaned.empty()) {
    return common::Result<std::string>::failure(invalid);
  }

  if (const auto scheme = split_scheme(cleaned);
      scheme.has_value() && !is_special(scheme->first)) {
    return common::Result<std::string>::failure("Unsupported URL scheme: \"" + scheme->first +
                                                ":\". Only HTTP and HTTPS URLs are supported.");
  }

  auto parsed = parse_url(cleaned);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(invalid);
  }

  Url url = std::move(parsed).value();
  if (url.scheme == "http") {
    url.scheme = "https";
    if (url.port == default_port(url.scheme)) {
      url.port.reset();
    }
  }
  return common::Result<std::string>::success(url.serialize());
}

common::Result<std::string> resolve_reference(std::string_view base,
                                              std::string_view reference) {
  auto parsed_base = parse_url(base);
  if (!parsed_base.ok()) {
    return common::Result<std::string>::failure("invalid base URL: " + parsed_base.error());
  }
  const Url &base_url = parsed_base.value();
  const std::string ref = common::trim(reference);

  std::string candidate;
  if (const auto scheme = split_scheme(ref); scheme.has_value()) {
    if (!is_special(scheme->first) && !common::starts_with(scheme->second, "//")) {
      // Opaque reference (mailto:, data:, ...): nothing to resolve.
      return common::Result<std::string>::success(ref);
    }
    candidate = ref;
  } else if (common::starts_with(ref, "//")) {
    candidate = base_url.scheme + ":" + ref;
  } else {
    const ReferenceParts parts = split_reference(ref);
    candidate = authority_prefix(base_url);
    if (parts.path.empty()) {
      candidate += base_url.path;
      if (parts.query.has_value()) {
        candidate += "?" + std::string(*parts.query);
      } else if (base_url.query.has_value()) {
        candidate += "?" + *base_url.query;
      }
    } else {
      if (parts.path.front() == '/') {
        candidate += parts.path;
      } else {
        const auto slash = base_url.path.rfind('/');
        candidate += (slash == std::string::npos ? std::string("/")
                                                 : base_url.path.substr(0, slash + 1)) +
                     std::string(parts.path);
      }
      if (parts.query.has_value()) {
        candidate += "?" + std::string(*parts.query);
      }
    }
    if (parts.fragment.has_value()) {
      candidate += "#" + std::string(*parts.fragment);
    }
  }

  auto resolved = parse_url(candidate);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure("invalid reference '" + ref +
                                                "': " + resolved.error());
  }
  return common::Result<std::string>::success(resolved.value().serialize());
}

std::optional<std::string> hostname_of(std::string_view locator) {
  auto parsed = parse_url(locator);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return parsed.value().host;
}

} // namespace webfetch::url
