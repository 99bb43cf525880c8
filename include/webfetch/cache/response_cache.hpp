#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace webfetch::cache {

struct CacheEntry {
  std::string content;
  std::chrono::steady_clock::time_point stored_at;
};

/// Extracted page text keyed by normalized locator. Entries expire lazily on
/// get() and eagerly on the periodic sweep.
class ResponseCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit ResponseCache(std::chrono::milliseconds ttl = std::chrono::minutes(15),
                         std::chrono::milliseconds sweep_interval = std::chrono::minutes(5),
                         Clock clock = {});
  ~ResponseCache();

  ResponseCache(const ResponseCache &) = delete;
  ResponseCache &operator=(const ResponseCache &) = delete;

  [[nodiscard]] std::optional<std::string> get(const std::string &key);
  void set(const std::string &key, std::string content);

  /// Remove every expired entry. Returns how many were removed.
  std::size_t sweep();

  [[nodiscard]] std::size_t size() const;
  void clear();

  /// Start the background sweep thread. A second call is a no-op.
  void start();
  /// Wake and join the sweep thread, then drop every entry.
  void stop();
  [[nodiscard]] bool running() const;

private:
  [[nodiscard]] std::chrono::steady_clock::time_point now() const;
  [[nodiscard]] bool expired(const CacheEntry &entry,
                             std::chrono::steady_clock::time_point at) const;
  void sweep_loop();

  std::chrono::milliseconds ttl_;
  std::chrono::milliseconds sweep_interval_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, CacheEntry> entries_;

  mutable std::mutex thread_mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool running_ = false;
  std::thread sweeper_;
};

} // namespace webfetch::cache
