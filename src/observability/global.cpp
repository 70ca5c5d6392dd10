#include "slotwatch/observability/global.hpp"

#include <mutex>

namespace slotwatch::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_cycle_start() { record_event(CycleStartEvent{}); }

void record_cycle_end(std::chrono::milliseconds duration, const bool success) {
  record_event(CycleEndEvent{.duration = duration, .success = success});
}

void record_availability(const std::uint64_t available, const std::uint64_t fresh) {
  record_event(AvailabilityEvent{.available = available, .fresh = fresh});
}

void record_notification(const std::string &channel, const bool success) {
  record_event(NotificationEvent{.channel = channel, .success = success});
}

void record_scheduler_tick() { record_event(SchedulerTickEvent{}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace slotwatch::observability
