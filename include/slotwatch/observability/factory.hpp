#pragma once

#include "slotwatch/config/schema.hpp"
#include "slotwatch/observability/observer.hpp"

#include <memory>

namespace slotwatch::observability {

/// "log", "none"/"noop", or a comma separated list of those. Unknown names log.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace slotwatch::observability
