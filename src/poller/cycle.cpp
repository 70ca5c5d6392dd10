#include "slotwatch/poller/cycle.hpp"

#include "slotwatch/availability/calculator.hpp"
#include "slotwatch/availability/differ.hpp"
#include "slotwatch/availability/format.hpp"
#include "slotwatch/observability/global.hpp"

#include <iostream>
#include <thread>

namespace slotwatch::poller {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const Clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

common::Result<CycleReport> fail_cycle(const Clock::time_point started, const std::string &step,
                                       const std::string &message) {
  const std::string error = step + ": " + message;
  std::cerr << "[cycle] " << error << "\n";
  observability::record_error("cycle", error);
  observability::record_cycle_end(elapsed_since(started), false);
  return common::Result<CycleReport>::failure(error);
}

common::Result<availability::AvailabilityList>
fetch_and_compute(source::SourceClient &source, const std::uint32_t lookahead_days,
                  const common::Timestamp &now) {
  const auto window = source::make_fetch_window(now, lookahead_days);
  const auto fetch_started = Clock::now();
  const auto data = source.fetch(window);
  observability::record_metric(
      observability::FetchLatencyMetric{.latency = elapsed_since(fetch_started)});
  if (!data.ok()) {
    return common::Result<availability::AvailabilityList>::failure(data.error());
  }
  return common::Result<availability::AvailabilityList>::success(
      availability::compute_availability(data.value().openings, data.value().reservations));
}

} // namespace

common::Result<availability::AvailabilityList>
preview_availability(source::SourceClient &source, const std::uint32_t lookahead_days,
                     const common::Timestamp &now) {
  return fetch_and_compute(source, lookahead_days, now);
}

common::Result<CycleReport> run_cycle(CycleContext &context, const common::Timestamp &now) {
  const auto started = Clock::now();
  observability::record_cycle_start();

  auto available = fetch_and_compute(context.source, context.lookahead_days, now);
  if (!available.ok()) {
    return fail_cycle(started, "fetch", available.error());
  }

  const auto previous = context.store.load();
  if (!previous.ok()) {
    return fail_cycle(started, "load", previous.error());
  }

  CycleReport report;
  report.available = std::move(available.value());
  report.fresh = availability::diff_availability(report.available, previous.value());

  if (auto saved = context.store.save(report.available); !saved.ok()) {
    return fail_cycle(started, "save", saved.error());
  }

  observability::record_availability(report.available.size(), report.fresh.size());
  observability::record_metric(
      observability::AvailableSlotsMetric{.count = report.available.size()});

  if (!report.fresh.empty()) {
    const std::string text = availability::format_notification(report.fresh);
    const std::string channel(context.notifier.name());
    for (std::uint32_t attempt = 0; attempt <= context.notify_retries; ++attempt) {
      const auto sent = context.notifier.notify(text);
      if (sent.ok()) {
        report.notified = true;
        report.notify_error.clear();
        break;
      }
      report.notify_error = sent.error();
      std::cerr << "[cycle] " << channel << " attempt " << (attempt + 1) << " failed: "
                << sent.error() << "\n";
      if (attempt < context.notify_retries) {
        std::this_thread::sleep_for(context.retry_delay);
      }
    }
    observability::record_notification(channel, report.notified);
    if (!report.notified) {
      observability::record_error(channel, report.notify_error);
    }
  }

  observability::record_cycle_end(elapsed_since(started), true);
  return common::Result<CycleReport>::success(std::move(report));
}

} // namespace slotwatch::poller
