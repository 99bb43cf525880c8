#include "webfetch/observability/global.hpp"

#include <mutex>

namespace webfetch::observability {

namespace {

std::mutex g_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> global_observer() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_observer) {
    g_observer = std::make_shared<NoopObserver>();
  }
  return g_observer;
}

void record_event(std::string_view component, std::string_view message) {
  global_observer()->record_event(component, message);
}

void record_error(std::string_view component, std::string_view message) {
  global_observer()->record_error(component, message);
}

} // namespace webfetch::observability
