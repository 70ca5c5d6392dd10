#pragma once

#include "slotwatch/observability/observer.hpp"

#include <memory>

namespace slotwatch::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_cycle_start();
void record_cycle_end(std::chrono::milliseconds duration, bool success);
void record_availability(std::uint64_t available, std::uint64_t fresh);
void record_notification(const std::string &channel, bool success);
void record_scheduler_tick();
void record_error(const std::string &component, const std::string &message);

} // namespace slotwatch::observability
