#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace webfetch::common {

/// One cancellation signal per invocation. Stages register a termination handler
/// while their process is active and remove it on every exit path.
class CancellationToken {
public:
  using Handler = std::function<void()>;
  using HandlerId = std::uint64_t;

  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Fire every registered handler once. Later calls are no-ops.
  void cancel();
  [[nodiscard]] bool is_cancelled() const;

  /// Register a handler. If the token already fired, the handler runs immediately
  /// on the calling thread and 0 is returned.
  HandlerId add_handler(Handler handler);

  /// Remove a handler. Blocks while another thread is running handlers so the
  /// caller may destroy whatever the handler captured once this returns.
  void remove_handler(HandlerId id);

  /// Wait until cancelled or the timeout elapses. Returns true when cancelled.
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  bool firing_ = false;
  std::thread::id firing_thread_;
  HandlerId next_id_ = 1;
  std::map<HandlerId, Handler> handlers_;
};

/// Scoped handler registration.
class CancelRegistration {
public:
  CancelRegistration(CancellationToken &token, CancellationToken::Handler handler);
  ~CancelRegistration();

  CancelRegistration(const CancelRegistration &) = delete;
  CancelRegistration &operator=(const CancelRegistration &) = delete;

private:
  CancellationToken &token_;
  CancellationToken::HandlerId id_ = 0;
};

} // namespace webfetch::common
