#pragma once

#include "webfetch/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace webfetch::url {

/// An absolute hierarchical URL, already canonicalized: lower-case scheme and
/// host, default port dropped, dot segments removed, unsafe bytes escaped.
struct Url {
  std::string scheme;
  std::string userinfo;
  std::string host;
  std::optional<std::uint16_t> port;
  std::string path = "/";
  std::optional<std::string> query;
  std::optional<std::string> fragment;

  [[nodiscard]] std::string serialize() const;
};

[[nodiscard]] std::optional<std::uint16_t> default_port(std::string_view scheme);

/// Parse an absolute URL with an authority component ("scheme://host/...").
[[nodiscard]] common::Result<Url> parse_url(std::string_view text);

/// Validate and canonicalize a caller-supplied locator. Accepts only http and
/// https, and upgrades http to https. The error text is meant for the caller.
[[nodiscard]] common::Result<std::string> normalize_locator(std::string_view input);

/// RFC 3986 section 5.2 reference resolution against an absolute base.
[[nodiscard]] common::Result<std::string> resolve_reference(std::string_view base,
                                                            std::string_view reference);

/// Lower-case host of an absolute URL, std::nullopt when it does not parse.
[[nodiscard]] std::optional<std::string> hostname_of(std::string_view locator);

} // namespace webfetch::url
