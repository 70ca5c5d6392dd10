#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotwatch/poller/cycle.hpp"
#include "slotwatch/poller/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;
using slotwatch::testing::open_day;
using slotwatch::testing::range;
using slotwatch::testing::ts;

struct CycleFixture {
  slotwatch::testing::FakeSourceClient source;
  slotwatch::testing::MemorySnapshotStore store;
  slotwatch::testing::RecordingNotifier notifier;

  CycleFixture() {
    source.data.openings = {open_day("2023-12-01", "2023-12-01T08:00:00+02:00",
                                     "2023-12-01T16:00:00+02:00")};
    source.data.reservations = {range("2023-12-01T10:00:00+02:00", "2023-12-01T11:00:00+02:00")};
  }

  slotwatch::poller::CycleContext context(std::uint32_t retries = 2) {
    return slotwatch::poller::CycleContext{.source = source,
                                           .store = store,
                                           .notifier = notifier,
                                           .lookahead_days = 14,
                                           .notify_retries = retries,
                                           .retry_delay = 0ms};
  }
};

bool wait_for(const std::function<bool()> &condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return condition();
}

} // namespace

void register_poller_tests(std::vector<slotwatch::tests::TestCase> &tests) {
  using slotwatch::tests::require;
  namespace poller = slotwatch::poller;
  const auto now = ts("2023-12-01T06:00:00Z");

  tests.push_back({"cycle_first_run_announces_everything", [now] {
                     CycleFixture fx;
                     auto ctx = fx.context();
                     const auto report = poller::run_cycle(ctx, now);
                     require(report.ok(), report.error());
                     require(report.value().available.size() == 2, "two free ranges");
                     require(report.value().fresh == report.value().available,
                             "no history, everything is new");
                     require(report.value().notified, "notification sent");
                     require(fx.notifier.messages.size() == 1, "one message");
                     require(fx.notifier.messages[0] ==
                                 "New available times:\n2023-12-01 08:00-10:00 (2h)\n"
                                 "2023-12-01 11:00-16:00 (5h)",
                             fx.notifier.messages[0]);
                     require(fx.store.stored == report.value().available, "snapshot updated");
                     require(fx.source.windows.size() == 1 && fx.source.windows[0].begin == now,
                             "fetch window starts now");
                   }});

  tests.push_back({"cycle_second_run_is_quiet", [now] {
                     CycleFixture fx;
                     auto ctx = fx.context();
                     require(poller::run_cycle(ctx, now).ok(), "first cycle");
                     const auto second = poller::run_cycle(ctx, now);
                     require(second.ok(), second.error());
                     require(second.value().fresh.empty(), "nothing new on unchanged data");
                     require(!second.value().notified, "no notification");
                     require(fx.notifier.calls == 1, "notifier untouched on second run");
                     require(fx.store.saves == 2, "snapshot still rewritten");
                   }});

  tests.push_back({"cycle_announces_only_new_ranges", [now] {
                     CycleFixture fx;
                     fx.store.stored = {range("2023-12-01T08:00:00+02:00", "2023-12-01T10:00:00+02:00")};
                     auto ctx = fx.context();
                     const auto report = poller::run_cycle(ctx, now);
                     require(report.ok(), report.error());
                     require(report.value().fresh.size() == 1, "one new range");
                     require(fx.notifier.messages.size() == 1 &&
                                 fx.notifier.messages[0] ==
                                     "New available times:\n2023-12-01 11:00-16:00 (5h)",
                             "only the new range is listed");
                   }});

  tests.push_back({"cycle_fetch_failure_leaves_snapshot_alone", [now] {
                     CycleFixture fx;
                     const auto previous =
                         slotwatch::availability::AvailabilityList{
                             range("2023-12-01T08:00:00Z", "2023-12-01T09:00:00Z")};
                     fx.store.stored = previous;
                     fx.source.error = "respa fetch failed status=503";
                     auto ctx = fx.context();
                     const auto report = poller::run_cycle(ctx, now);
                     require(!report.ok(), "cycle should fail");
                     require(report.error().find("status=503") != std::string::npos,
                             report.error());
                     require(fx.store.saves == 0 && fx.store.stored == previous,
                             "snapshot untouched");
                     require(fx.notifier.calls == 0, "no notification");
                   }});

  tests.push_back({"cycle_load_and_save_failures_fail_the_cycle", [now] {
                     CycleFixture load_fx;
                     load_fx.store.load_error = "disk unreadable";
                     auto load_ctx = load_fx.context();
                     require(!poller::run_cycle(load_ctx, now).ok(), "load failure fails");
                     require(load_fx.notifier.calls == 0, "no notification after load failure");

                     CycleFixture save_fx;
                     save_fx.store.save_error = "disk full";
                     auto save_ctx = save_fx.context();
                     const auto report = poller::run_cycle(save_ctx, now);
                     require(!report.ok() && report.error().find("disk full") != std::string::npos,
                             "save failure fails");
                     require(save_fx.notifier.calls == 0, "nothing announced when save fails");
                   }});

  tests.push_back({"cycle_retries_notification", [now] {
                     CycleFixture fx;
                     fx.notifier.failures_before_success = 2;
                     auto ctx = fx.context(2);
                     const auto report = poller::run_cycle(ctx, now);
                     require(report.ok(), report.error());
                     require(report.value().notified, "third attempt delivers");
                     require(fx.notifier.calls == 3, "two retries");
                     require(report.value().notify_error.empty(), "error cleared on success");
                   }});

  tests.push_back({"cycle_notification_failure_is_reported_not_fatal", [now] {
                     CycleFixture fx;
                     fx.notifier.failures_before_success = std::numeric_limits<std::size_t>::max();
                     auto ctx = fx.context(1);
                     const auto report = poller::run_cycle(ctx, now);
                     require(report.ok(), "cycle still succeeds");
                     require(!report.value().notified, "not delivered");
                     require(fx.notifier.calls == 2, "one retry");
                     require(!report.value().notify_error.empty(), "error recorded");
                     require(fx.store.stored == report.value().available, "snapshot persisted");
                   }});

  tests.push_back({"preview_does_not_persist_or_notify", [now] {
                     CycleFixture fx;
                     const auto available = poller::preview_availability(fx.source, 14, now);
                     require(available.ok(), available.error());
                     require(available.value().size() == 2, "computed availability");
                     require(fx.store.saves == 0 && fx.notifier.calls == 0, "side effect free");
                   }});

  tests.push_back({"scheduler_runs_immediately_and_repeats", [] {
                     std::atomic<int> runs{0};
                     poller::Scheduler scheduler([&runs]() { ++runs; },
                                                 poller::SchedulerOptions{.interval = 50ms,
                                                                          .run_immediately = true});
                     scheduler.start();
                     require(scheduler.is_running(), "running after start");
                     require(wait_for([&runs] { return runs.load() >= 3; }, 3s),
                             "should tick repeatedly");
                     scheduler.stop();
                     require(!scheduler.is_running(), "stopped");
                     const int after_stop = runs.load();
                     std::this_thread::sleep_for(150ms);
                     require(runs.load() == after_stop, "no ticks after stop");
                     require(scheduler.cycles_run() == static_cast<std::uint64_t>(after_stop),
                             "cycles_run counts ticks");
                   }});

  tests.push_back({"scheduler_waits_when_not_immediate", [] {
                     std::atomic<int> runs{0};
                     poller::Scheduler scheduler([&runs]() { ++runs; },
                                                 poller::SchedulerOptions{.interval = 10s,
                                                                          .run_immediately = false});
                     scheduler.start();
                     std::this_thread::sleep_for(200ms);
                     require(runs.load() == 0, "first tick waits one interval");
                     const auto stop_started = std::chrono::steady_clock::now();
                     scheduler.stop();
                     require(std::chrono::steady_clock::now() - stop_started < 1s,
                             "stop interrupts the wait promptly");
                   }});

  tests.push_back({"scheduler_never_overlaps_ticks", [] {
                     std::atomic<int> active{0};
                     std::atomic<bool> overlapped{false};
                     std::atomic<int> runs{0};
                     poller::Scheduler scheduler(
                         [&]() {
                           if (active.fetch_add(1) != 0) {
                             overlapped = true;
                           }
                           std::this_thread::sleep_for(30ms);
                           active.fetch_sub(1);
                           ++runs;
                         },
                         poller::SchedulerOptions{.interval = 10ms, .run_immediately = true});
                     scheduler.start();
                     require(wait_for([&runs] { return runs.load() >= 3; }, 3s), "overrun ticks run");
                     scheduler.stop();
                     require(!overlapped.load(), "ticks must run one at a time");
                   }});

  tests.push_back({"scheduler_stop_lets_running_tick_finish", [] {
                     std::atomic<bool> started{false};
                     std::atomic<bool> finished{false};
                     poller::Scheduler scheduler(
                         [&]() {
                           started = true;
                           std::this_thread::sleep_for(200ms);
                           finished = true;
                         },
                         poller::SchedulerOptions{.interval = 10s, .run_immediately = true});
                     scheduler.start();
                     require(wait_for([&started] { return started.load(); }, 2s), "tick started");
                     scheduler.stop();
                     require(finished.load(), "stop waits for the in-flight tick");
                   }});

  tests.push_back({"scheduler_survives_throwing_task", [] {
                     std::atomic<int> runs{0};
                     poller::Scheduler scheduler(
                         [&runs]() {
                           ++runs;
                           throw std::runtime_error("boom");
                         },
                         poller::SchedulerOptions{.interval = 20ms, .run_immediately = true});
                     scheduler.start();
                     require(wait_for([&runs] { return runs.load() >= 2; }, 3s),
                             "keeps ticking after a failure");
                     scheduler.stop();
                   }});
}
