#pragma once

#include "webfetch/observability/observer.hpp"

#include <memory>
#include <string_view>

namespace webfetch::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> global_observer();

void record_event(std::string_view component, std::string_view message);
void record_error(std::string_view component, std::string_view message);

} // namespace webfetch::observability
