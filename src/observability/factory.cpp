#include "webfetch/observability/factory.hpp"

#include "webfetch/common/fs.hpp"

namespace webfetch::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none") {
    return std::make_shared<NoopObserver>();
  }
  return std::make_shared<LogObserver>();
}

} // namespace webfetch::observability
