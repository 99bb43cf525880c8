#include "webfetch/observability/observer.hpp"

#include <iostream>

namespace webfetch::observability {

void LogObserver::record_event(std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << component << "] " << message << "\n";
}

void LogObserver::record_error(std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << component << "] error: " << message << "\n";
}

} // namespace webfetch::observability
