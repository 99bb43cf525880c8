#include "webfetch/common/cancel.hpp"

#include <vector>

namespace webfetch::common {

void CancellationToken::cancel() {
  std::vector<Handler> to_run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    firing_ = true;
    firing_thread_ = std::this_thread::get_id();
    to_run.reserve(handlers_.size());
    for (auto &[id, handler] : handlers_) {
      to_run.push_back(std::move(handler));
    }
    handlers_.clear();
  }
  cv_.notify_all();

  for (auto &handler : to_run) {
    if (handler) {
      handler();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    firing_ = false;
  }
  cv_.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

CancellationToken::HandlerId CancellationToken::add_handler(Handler handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      const HandlerId id = next_id_++;
      handlers_.emplace(id, std::move(handler));
      return id;
    }
  }
  if (handler) {
    handler();
  }
  return 0;
}

void CancellationToken::remove_handler(HandlerId id) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (id != 0) {
    handlers_.erase(id);
  }
  if (firing_ && firing_thread_ != std::this_thread::get_id()) {
    cv_.wait(lock, [this]() { return !firing_; });
  }
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

CancelRegistration::CancelRegistration(CancellationToken &token,
                                       CancellationToken::Handler handler)
    : token_(token), id_(token.add_handler(std::move(handler))) {}

CancelRegistration::~CancelRegistration() { token_.remove_handler(id_); }

} // namespace webfetch::common
