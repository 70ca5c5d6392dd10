#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace slotwatch::observability {

struct CycleStartEvent {};

struct CycleEndEvent {
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct AvailabilityEvent {
  std::uint64_t available = 0;
  std::uint64_t fresh = 0;
};

struct NotificationEvent {
  std::string channel;
  bool success = false;
};

struct SchedulerTickEvent {};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<CycleStartEvent, CycleEndEvent, AvailabilityEvent,
                                   NotificationEvent, SchedulerTickEvent, ErrorEvent>;

struct FetchLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct AvailableSlotsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<FetchLatencyMetric, AvailableSlotsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace slotwatch::observability
