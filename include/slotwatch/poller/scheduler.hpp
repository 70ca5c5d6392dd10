#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace slotwatch::poller {

struct SchedulerOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(600)};
  bool run_immediately = true;
};

/// Runs a task on a fixed cadence on one worker thread. Ticks never overlap;
/// a tick that overruns the interval makes the next one start right away.
class Scheduler {
public:
  using Task = std::function<void()>;

  explicit Scheduler(Task task, SchedulerOptions options = {});
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void start();
  /// Waits for an in-flight tick to finish; never interrupts it.
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t cycles_run() const;

private:
  void run_loop();
  [[nodiscard]] bool wait_until(std::chrono::steady_clock::time_point deadline) const;

  Task task_;
  SchedulerOptions options_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> cycles_run_{0};
};

} // namespace slotwatch::poller
