#include "slotwatch/poller/scheduler.hpp"

#include "slotwatch/observability/global.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace slotwatch::poller {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{100};

} // namespace

Scheduler::Scheduler(Task task, SchedulerOptions options)
    : task_(std::move(task)), options_(options) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void Scheduler::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Scheduler::is_running() const { return running_; }

std::uint64_t Scheduler::cycles_run() const { return cycles_run_; }

bool Scheduler::wait_until(const std::chrono::steady_clock::time_point deadline) const {
  while (running_) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::max(std::min(remaining, kWaitSlice),
                                         std::chrono::milliseconds(1)));
  }
  return false;
}

void Scheduler::run_loop() {
  auto next_tick = std::chrono::steady_clock::now();
  if (!options_.run_immediately) {
    next_tick += options_.interval;
  }

  while (wait_until(next_tick)) {
    const auto tick_started = std::chrono::steady_clock::now();
    observability::record_scheduler_tick();
    if (task_) {
      try {
        task_();
      } catch (const std::exception &err) {
        std::cerr << "[scheduler] tick failed: " << err.what() << "\n";
        observability::record_error("scheduler", err.what());
      }
    }
    ++cycles_run_;
    next_tick = tick_started + options_.interval;
  }
}

} // namespace slotwatch::poller
