#pragma once

#include "webfetch/config/schema.hpp"
#include "webfetch/observability/observer.hpp"

#include <memory>

namespace webfetch::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace webfetch::observability
