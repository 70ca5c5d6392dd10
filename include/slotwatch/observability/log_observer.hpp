#pragma once

#include "slotwatch/observability/observer.hpp"

namespace slotwatch::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace slotwatch::observability
