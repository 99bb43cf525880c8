#include "webfetch/cache/response_cache.hpp"

#include "webfetch/observability/global.hpp"

namespace webfetch::cache {

ResponseCache::ResponseCache(std::chrono::milliseconds ttl,
                             std::chrono::milliseconds sweep_interval, Clock clock)
    : ttl_(ttl), sweep_interval_(sweep_interval), clock_(std::move(clock)) {}

ResponseCache::~ResponseCache() { stop(); }

std::chrono::steady_clock::time_point ResponseCache::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool ResponseCache::expired(const CacheEntry &entry,
                            std::chrono::steady_clock::time_point at) const {
  return at - entry.stored_at > ttl_;
}

std::optional<std::string> ResponseCache::get(const std::string &key) {
  const auto at = now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (expired(it->second, at)) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.content;
}

void ResponseCache::set(const std::string &key, std::string content) {
  CacheEntry entry{.content = std::move(content), .stored_at = now()};
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.insert_or_assign(key, std::move(entry));
}

std::size_t ResponseCache::sweep() {
  const auto at = now();
  std::size_t removed = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (expired(it->second, at)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

void ResponseCache::start() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (running_) {
    return;
  }
  stop_requested_ = false;
  running_ = true;
  sweeper_ = std::thread([this]() { sweep_loop(); });
}

void ResponseCache::stop() {
  {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (running_) {
      stop_requested_ = true;
      running_ = false;
    }
  }
  cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
  clear();
}

bool ResponseCache::running() const {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  return running_;
}

void ResponseCache::sweep_loop() {
  std::unique_lock<std::mutex> lock(thread_mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, sweep_interval_, [this]() { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    const std::size_t removed = sweep();
    if (removed > 0) {
      observability::record_event("cache", "swept " + std::to_string(removed) +
                                               " expired entr" + (removed == 1 ? "y" : "ies"));
    }
    lock.lock();
  }
}

} // namespace webfetch::cache
