#include "webfetch/browser/page_fetcher.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/observability/global.hpp"
#include "webfetch/url/locator.hpp"

#include <condition_variable>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace webfetch::browser {

namespace {

constexpr auto WAIT_SLICE = std::chrono::milliseconds(100);

struct NavigationState {
  std::mutex mutex;
  std::condition_variable cv;
  std::string main_frame;
  /// Host typed by the caller until the first main-frame document request
  /// replaces it with the browser's ASCII form.
  std::string original_host;
  bool host_from_browser = false;
  std::set<std::string> idle_loaders;
  std::optional<std::string> cross_host_target;
};

common::StageFailure stage_failure(common::ErrorKind kind, std::string reason,
                                   std::string diagnostic = {}) {
  return common::StageFailure{
      .kind = kind, .reason = std::move(reason), .diagnostic = std::move(diagnostic)};
}

std::string map_value(const JsonMap &map, const std::string &key) {
  const auto it = map.find(key);
  return it == map.end() ? std::string{} : it->second;
}

std::string timeout_reason(std::chrono::milliseconds timeout, const std::string &locator) {
  return "Page load timed out after " +
         std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) +
         " seconds for URL: " + locator;
}

void watch_navigation(CDPClient &client, const std::shared_ptr<NavigationState> &state) {
  client.on_event("Page.lifecycleEvent", [state](const std::string &, const JsonMap &params) {
    if (map_value(params, "name") != "networkAlmostIdle") {
      return;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (map_value(params, "frameId") != state->main_frame) {
      return;
    }
    state->idle_loaders.insert(map_value(params, "loaderId"));
    state->cv.notify_all();
  });

  client.on_event(
      "Network.requestWillBeSent", [state](const std::string &, const JsonMap &params) {
        if (map_value(params, "type") != "Document") {
          return;
        }
        const std::string redirect_response = map_value(params, "redirectResponse");
        if (redirect_response.empty()) {
          const auto host =
              url::hostname_of(common::json_get_string(map_value(params, "request"), "url"));
          std::lock_guard<std::mutex> lock(state->mutex);
          if (!state->host_from_browser && host.has_value() &&
              map_value(params, "frameId") == state->main_frame) {
            state->original_host = *host;
            state->host_from_browser = true;
          }
          return;
        }
        std::string original_host;
        {
          std::lock_guard<std::mutex> lock(state->mutex);
          if (map_value(params, "frameId") != state->main_frame) {
            return;
          }
          original_host = state->original_host;
        }

        int status = 0;
        try {
          status = static_cast<int>(
              std::stod(common::json_get_number(redirect_response, "status")));
        } catch (const std::exception &) {
          return;
        }
        const std::string location =
            find_header(common::json_get_object(redirect_response, "headers"), "location");
        const std::string from = common::json_get_string(redirect_response, "url");

        const auto hop = classify_redirect(original_host, from, status, location);
        if (!hop.has_value()) {
          return;
        }
        observability::record_event("browser", std::string(hop->cross_host ? "cross-host"
                                                                           : "same-host") +
                                                   " redirect " + std::to_string(status) +
                                                   " to " + hop->target);
        if (hop->cross_host) {
          std::lock_guard<std::mutex> lock(state->mutex);
          state->cross_host_target = hop->target;
        }
      });
}

common::Result<std::string> evaluate_string(CDPClient &client, const std::string &expression) {
  auto evaluated = client.evaluate_js(expression);
  if (!evaluated.ok()) {
    return common::Result<std::string>::failure(evaluated.error());
  }
  const std::string remote_object = map_value(evaluated.value(), "result");
  return common::Result<std::string>::success(common::json_get_string(remote_object, "value"));
}

FetchOutcome render(CDPClient &client, const std::string &locator,
                    std::chrono::milliseconds page_timeout, common::CancellationToken &cancel) {
  using common::ErrorKind;
  auto state = std::make_shared<NavigationState>();
  state->original_host = url::hostname_of(locator).value_or("");

  auto target = client.send_command_json("Target.createTarget", R"({"url":"about:blank"})");
  if (!target.ok()) {
    return stage_failure(ErrorKind::NetworkFailure, "Browser error: " + target.error());
  }
  const std::string target_id = map_value(target.value(), "targetId");
  auto attached = client.send_command_json(
      "Target.attachToTarget",
      R"({"targetId":")" + common::json_escape(target_id) + R"(","flatten":true})");
  if (!attached.ok()) {
    return stage_failure(ErrorKind::NetworkFailure, "Browser error: " + attached.error());
  }
  client.set_session_id(map_value(attached.value(), "sessionId"));
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->main_frame = target_id;
  }
  watch_navigation(client, state);

  static const std::vector<std::pair<std::string, std::string>> setup = {
      {"Page.enable", "{}"},
      {"Page.setLifecycleEventsEnabled", R"({"enabled":true})"},
      {"Network.enable", "{}"},
  };
  for (const auto &[method, params] : setup) {
    auto enabled = client.send_command_json(method, params);
    if (!enabled.ok()) {
      return stage_failure(ErrorKind::NetworkFailure, "Browser error: " + enabled.error());
    }
  }

  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }

  const auto started = std::chrono::steady_clock::now();
  auto navigated = client.send_command_json(
      "Page.navigate", R"({"url":")" + common::json_escape(locator) + R"("})", page_timeout);
  if (!navigated.ok()) {
    if (navigated.error().find("timed out") != std::string::npos) {
      return stage_failure(ErrorKind::Timeout, timeout_reason(page_timeout, locator));
    }
    return stage_failure(ErrorKind::NetworkFailure, "Failed to load page: " + navigated.error());
  }
  const std::string error_text = map_value(navigated.value(), "errorText");
  if (!error_text.empty()) {
    return stage_failure(ErrorKind::NetworkFailure, "Failed to load page: " + error_text);
  }
  const std::string loader_id = map_value(navigated.value(), "loaderId");

  const auto deadline = started + page_timeout;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
      const bool settled = loader_id.empty() ? !state->idle_loaders.empty()
                                             : state->idle_loaders.count(loader_id) > 0;
      if (settled) {
        break;
      }
      if (cancel.is_cancelled()) {
        return common::aborted_failure();
      }
      if (!client.is_connected()) {
        return stage_failure(ErrorKind::NetworkFailure, "Browser error: connection closed");
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        return stage_failure(ErrorKind::Timeout, timeout_reason(page_timeout, locator));
      }
      state->cv.wait_for(lock, WAIT_SLICE);
    }
  }
  observability::record_event("browser", "navigation settled for " + locator);

  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cross_host_target.has_value()) {
      return Redirected{.target_locator = *state->cross_host_target};
    }
  }

  auto markup = evaluate_string(
      client, "document.documentElement ? document.documentElement.outerHTML : ''");
  if (!markup.ok()) {
    return stage_failure(ErrorKind::NetworkFailure, "Browser error: " + markup.error());
  }
  auto final_locator = evaluate_string(client, "location.href");
  if (!final_locator.ok()) {
    return stage_failure(ErrorKind::NetworkFailure, "Browser error: " + final_locator.error());
  }
  return Rendered{.markup = std::move(markup).value(),
                  .final_locator = std::move(final_locator).value()};
}

} // namespace

std::optional<RedirectHop> classify_redirect(std::string_view original_host,
                                             std::string_view redirecting_locator, int status,
                                             std::string_view location) {
  if (status < 300 || status >= 400) {
    return std::nullopt;
  }
  if (common::trim(location).empty()) {
    return std::nullopt;
  }
  auto resolved = url::resolve_reference(redirecting_locator, location);
  if (!resolved.ok()) {
    return std::nullopt;
  }
  const auto host = url::hostname_of(resolved.value());
  if (!host.has_value()) {
    return std::nullopt;
  }
  return RedirectHop{.target = resolved.value(),
                     .cross_host = *host != common::to_lower(original_host)};
}

std::string find_header(std::string_view headers_json, std::string_view name) {
  const std::string wanted = common::to_lower(name);
  for (const auto &[key, value] : common::json_parse_flat(headers_json)) {
    if (common::to_lower(key) == wanted) {
      return value;
    }
  }
  return "";
}

PageFetcher::PageFetcher(std::shared_ptr<IBrowserLauncher> launcher,
                         std::chrono::milliseconds page_timeout)
    : launcher_(std::move(launcher)), page_timeout_(page_timeout) {}

FetchOutcome PageFetcher::fetch(const std::string &locator, common::CancellationToken &cancel) {
  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }

  auto launched = launcher_->launch(cancel);
  if (!launched.ok()) {
    if (cancel.is_cancelled()) {
      return common::aborted_failure();
    }
    observability::record_error("browser", launched.error());
    return stage_failure(common::ErrorKind::ProcessLaunchFailure,
                         "Browser error: " + launched.error());
  }
  std::unique_ptr<IBrowserSession> session = std::move(launched).value();

  FetchOutcome outcome;
  {
    IBrowserSession *raw = session.get();
    common::CancelRegistration registration(cancel, [raw]() { raw->abort(); });
    outcome = render(session->client(), locator, page_timeout_, cancel);
  }
  // Tear the browser down before reporting.
  session.reset();

  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }
  return outcome;
}

} // namespace webfetch::browser
