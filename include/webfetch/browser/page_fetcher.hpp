#pragma once

#include "webfetch/browser/launcher.hpp"
#include "webfetch/common/cancel.hpp"
#include "webfetch/common/errors.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace webfetch::browser {

struct Rendered {
  std::string markup;
  std::string final_locator;
};

struct Redirected {
  std::string target_locator;
};

using FetchOutcome = std::variant<Rendered, Redirected, common::StageFailure>;

class IPageFetcher {
public:
  virtual ~IPageFetcher() = default;
  [[nodiscard]] virtual FetchOutcome fetch(const std::string &locator,
                                           common::CancellationToken &cancel) = 0;
};

struct RedirectHop {
  std::string target;
  bool cross_host = false;
};

/// Classify one redirect response of the main document. Returns std::nullopt when
/// the response is not a 3xx with a usable Location header.
[[nodiscard]] std::optional<RedirectHop> classify_redirect(std::string_view original_host,
                                                           std::string_view redirecting_locator,
                                                           int status,
                                                           std::string_view location);

/// Case-insensitive header lookup in a raw JSON headers object.
[[nodiscard]] std::string find_header(std::string_view headers_json, std::string_view name);

class PageFetcher final : public IPageFetcher {
public:
  PageFetcher(std::shared_ptr<IBrowserLauncher> launcher, std::chrono::milliseconds page_timeout);

  [[nodiscard]] FetchOutcome fetch(const std::string &locator,
                                   common::CancellationToken &cancel) override;

private:
  std::shared_ptr<IBrowserLauncher> launcher_;
  std::chrono::milliseconds page_timeout_;
};

} // namespace webfetch::browser
