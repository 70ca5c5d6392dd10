#include "slotwatch/observability/log_observer.hpp"

#include "slotwatch/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace slotwatch::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << common::now_rfc3339() << " [" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, CycleStartEvent>) {
          log_line("DEBUG", "cycle.start");
        } else if constexpr (std::is_same_v<T, CycleEndEvent>) {
          log_line(evt.success ? "INFO" : "ERROR",
                   "cycle.end duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, AvailabilityEvent>) {
          log_line("INFO", "availability available=" + std::to_string(evt.available) +
                               " fresh=" + std::to_string(evt.fresh));
        } else if constexpr (std::is_same_v<T, NotificationEvent>) {
          log_line(evt.success ? "INFO" : "ERROR",
                   "notify channel=" + evt.channel + " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          log_line("DEBUG", "scheduler.tick");
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, FetchLatencyMetric>) {
          log_line("DEBUG", "metric.fetch_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, AvailableSlotsMetric>) {
          log_line("DEBUG", "metric.available_slots=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace slotwatch::observability
