#include "slotwatch/observability/factory.hpp"

#include "slotwatch/common/fs.hpp"
#include "slotwatch/observability/log_observer.hpp"
#include "slotwatch/observability/multi_observer.hpp"
#include "slotwatch/observability/noop_observer.hpp"

#include <sstream>

namespace slotwatch::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.empty() || backend == "log") {
    return std::make_unique<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>());
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    if (multi->size() == 0) {
      return std::make_unique<LogObserver>();
    }
    return multi;
  }

  return std::make_unique<LogObserver>();
}

} // namespace slotwatch::observability
