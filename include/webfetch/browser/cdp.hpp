#pragma once

#include "webfetch/common/json_util.hpp"
#include "webfetch/common/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace webfetch::browser {

using JsonMap = common::JsonMap;

/// Text-frame transport to a DevTools endpoint.
class ICDPTransport {
public:
  virtual ~ICDPTransport() = default;

  [[nodiscard]] virtual common::Status connect(const std::string &ws_url) = 0;
  /// Must be callable from any thread and unblock a pending receive_text().
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;
  [[nodiscard]] virtual common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) = 0;
};

/// DevTools protocol client. A reader thread routes command responses to their
/// callers and events to the registered callbacks.
class CDPClient {
public:
  using EventCallback = std::function<void(const std::string &method, const JsonMap &params)>;

  explicit CDPClient(std::unique_ptr<ICDPTransport> transport);
  ~CDPClient();

  CDPClient(const CDPClient &) = delete;
  CDPClient &operator=(const CDPClient &) = delete;

  [[nodiscard]] common::Status connect(const std::string &ws_url);
  void disconnect();
  /// Close the transport without joining the reader. Safe from any thread.
  void interrupt();
  [[nodiscard]] bool is_connected() const;

  /// Route later commands to a flattened target session ("" for the browser).
  void set_session_id(std::string session_id);
  [[nodiscard]] std::string session_id() const;

  [[nodiscard]] common::Result<JsonMap>
  send_command(const std::string &method, const JsonMap &params = {},
               std::chrono::milliseconds timeout = std::chrono::seconds(30));

  /// Same as send_command with `params_json` emitted verbatim.
  [[nodiscard]] common::Result<JsonMap>
  send_command_json(const std::string &method, const std::string &params_json,
                    std::chrono::milliseconds timeout = std::chrono::seconds(30));

  void on_event(const std::string &method, EventCallback callback);

  /// Runtime.evaluate with returnByValue. Returns the result map.
  [[nodiscard]] common::Result<JsonMap> evaluate_js(const std::string &expression);

private:
  struct PendingCall {
    bool done = false;
    std::string response;
    std::string error;
  };

  void reader_loop();
  void dispatch(const std::string &message);
  void fail_pending(const std::string &reason);

  std::unique_ptr<ICDPTransport> transport_;
  std::thread reader_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int next_id_ = 1;
  std::string session_id_;
  std::unordered_map<int, std::shared_ptr<PendingCall>> pending_;
  std::unordered_map<std::string, std::vector<EventCallback>> callbacks_;
  std::optional<std::string> closed_reason_;

  std::mutex send_mutex_;
};

} // namespace webfetch::browser
