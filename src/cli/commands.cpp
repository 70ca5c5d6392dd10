#include "slotwatch/cli/commands.hpp"

#include "slotwatch/availability/format.hpp"
#include "slotwatch/common/fs.hpp"
#include "slotwatch/config/config.hpp"
#include "slotwatch/daemon/pid_file.hpp"
#include "slotwatch/http/client.hpp"
#include "slotwatch/notify/notifier.hpp"
#include "slotwatch/observability/factory.hpp"
#include "slotwatch/observability/global.hpp"
#include "slotwatch/poller/cycle.hpp"
#include "slotwatch/poller/scheduler.hpp"
#include "slotwatch/snapshot/snapshot_store.hpp"
#include "slotwatch/source/source_client.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace slotwatch::cli {

namespace {

constexpr const char *PID_FILENAME = "slotwatch.pid";

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef SLOTWATCH_VERSION
  std::string version = SLOTWATCH_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SLOTWATCH_GIT_COMMIT
  const std::string commit = SLOTWATCH_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "slotwatch " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool reject_extra_args(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument for " << command << ": " << args.front() << "\n";
  return true;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Watches a bookable facility and sends newly opened times to Telegram.\n\n";
  std::cout << "Usage: slotwatch [--config <path>] <command>\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [--duration-secs N]  Poll on the configured interval until stopped\n";
  std::cout << "  once                     Run a single poll cycle\n";
  std::cout << "  preview                  Print current availability without saving or notifying\n";
  std::cout << "  status                   Print the last saved availability\n";
  std::cout << "  init                     Write a default config file\n";
  std::cout << "  config-path              Print the config file location\n";
  std::cout << "  version                  Print the version\n";
  std::cout << "  help                     Show this help\n\n";
  std::cout << "Environment:\n";
  std::cout << "  TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID, SLOTWATCH_CONFIG_PATH, SLOTWATCH_ENV_FILE,\n";
  std::cout << "  SLOTWATCH_RESOURCE_ID, SLOTWATCH_API_BASE, SLOTWATCH_LOOKAHEAD_DAYS,\n";
  std::cout << "  SLOTWATCH_POLL_INTERVAL_SECS, SLOTWATCH_SNAPSHOT_PATH\n";
}

void print_ranges(const availability::AvailabilityList &ranges) {
  if (ranges.empty()) {
    std::cout << "  (none)\n";
    return;
  }
  for (const auto &range : ranges) {
    std::cout << "  " << availability::format_range(range) << "\n";
  }
}

common::Result<config::Config> load_checked_config(const bool require_telegram) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  if (!require_telegram) {
    return cfg;
  }
  const auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure("invalid configuration: " + validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return cfg;
}

/// Long-lived collaborators shared by every cycle of one process.
struct PollerRuntime {
  std::shared_ptr<http::HttpClient> http;
  std::unique_ptr<source::RespaSourceClient> source;
  std::unique_ptr<snapshot::JsonFileSnapshotStore> store;
  std::unique_ptr<notify::TelegramNotifier> notifier;
};

common::Result<std::unique_ptr<PollerRuntime>> build_runtime(const config::Config &cfg) {
  const auto path = config::snapshot_path(cfg);
  if (!path.ok()) {
    return common::Result<std::unique_ptr<PollerRuntime>>::failure(path.error());
  }
  auto runtime = std::make_unique<PollerRuntime>();
  runtime->http = std::make_shared<http::CurlHttpClient>();
  runtime->source = std::make_unique<source::RespaSourceClient>(cfg.source, runtime->http);
  runtime->store = std::make_unique<snapshot::JsonFileSnapshotStore>(path.value());
  runtime->notifier = std::make_unique<notify::TelegramNotifier>(cfg.telegram, runtime->http);
  return common::Result<std::unique_ptr<PollerRuntime>>::success(std::move(runtime));
}

poller::CycleContext make_context(PollerRuntime &runtime, const config::Config &cfg) {
  return poller::CycleContext{.source = *runtime.source,
                              .store = *runtime.store,
                              .notifier = *runtime.notifier,
                              .lookahead_days = cfg.source.lookahead_days,
                              .notify_retries = cfg.poller.notify_retries};
}

int run_poll_loop(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", duration_raw);
  if (reject_extra_args(args, "run")) {
    return 1;
  }

  std::uint64_t duration_secs = 0;
  if (!duration_raw.empty()) {
    const auto *first = duration_raw.data();
    const auto *last = first + duration_raw.size();
    auto [ptr, ec] = std::from_chars(first, last, duration_secs);
    if (ec != std::errc() || ptr != last) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  auto cfg = load_checked_config(true);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  const auto cfg_dir = config::config_dir();
  if (!cfg_dir.ok()) {
    std::cerr << cfg_dir.error() << "\n";
    return 1;
  }
  daemon::PidFile pid_file(cfg_dir.value() / PID_FILENAME);
  if (auto acquired = pid_file.acquire(); !acquired.ok()) {
    std::cerr << acquired.error() << "\n";
    return 1;
  }

  auto runtime = build_runtime(cfg.value());
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto context = make_context(*runtime.value(), cfg.value());

  poller::Scheduler scheduler(
      [&context]() {
        const auto report = poller::run_cycle(context, common::now_utc());
        if (report.ok() && !report.value().fresh.empty() && !report.value().notified) {
          std::cerr << "[cycle] " << report.value().fresh.size()
                    << " new range(s) not delivered: " << report.value().notify_error << "\n";
        }
      },
      poller::SchedulerOptions{
          .interval = std::chrono::seconds(cfg.value().poller.interval_secs),
          .run_immediately = cfg.value().poller.run_immediately});

  g_stop_requested = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  std::cout << "Polling resource " << cfg.value().source.resource_id << " every "
            << cfg.value().poller.interval_secs << "s (Ctrl+C to stop)\n";
  scheduler.start();

  const auto started = std::chrono::steady_clock::now();
  while (g_stop_requested == 0) {
    if (duration_secs > 0 && std::chrono::steady_clock::now() - started >=
                                 std::chrono::seconds(duration_secs)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "Stopping after " << scheduler.cycles_run() << " cycle(s)\n";
  scheduler.stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_once(std::vector<std::string> args) {
  if (reject_extra_args(args, "once")) {
    return 1;
  }
  auto cfg = load_checked_config(true);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto runtime = build_runtime(cfg.value());
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto context = make_context(*runtime.value(), cfg.value());
  const auto report = poller::run_cycle(context, common::now_utc());
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }

  std::cout << "Available (" << report.value().available.size() << "):\n";
  print_ranges(report.value().available);
  std::cout << "New (" << report.value().fresh.size() << "):\n";
  print_ranges(report.value().fresh);
  if (!report.value().fresh.empty()) {
    if (report.value().notified) {
      std::cout << "Notification sent.\n";
    } else {
      std::cout << "Notification failed: " << report.value().notify_error << "\n";
    }
  }
  return 0;
}

int run_preview(std::vector<std::string> args) {
  if (reject_extra_args(args, "preview")) {
    return 1;
  }
  auto cfg = load_checked_config(false);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  source::RespaSourceClient source(cfg.value().source);
  const auto available =
      poller::preview_availability(source, cfg.value().source.lookahead_days, common::now_utc());
  if (!available.ok()) {
    std::cerr << available.error() << "\n";
    return 1;
  }
  std::cout << "Available in the next " << cfg.value().source.lookahead_days << " day(s):\n";
  print_ranges(available.value());
  return 0;
}

int run_status(std::vector<std::string> args) {
  if (reject_extra_args(args, "status")) {
    return 1;
  }
  auto cfg = load_checked_config(false);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto path = config::snapshot_path(cfg.value());
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  const auto cp = config::config_path();
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  std::cout << "Resource: " << cfg.value().source.resource_id << "\n";
  std::cout << "Snapshot: " << path.value().string() << "\n";

  if (const auto cfg_dir = config::config_dir(); cfg_dir.ok()) {
    const daemon::PidFile pid_file(cfg_dir.value() / PID_FILENAME);
    const auto pid = pid_file.read_pid();
    if (pid.has_value() && daemon::PidFile::is_process_running(*pid)) {
      std::cout << "Poller: running (pid " << *pid << ")\n";
    } else {
      std::cout << "Poller: stopped\n";
    }
  }

  snapshot::JsonFileSnapshotStore store(path.value());
  const auto saved = store.load();
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Last announced (" << saved.value().size() << "):\n";
  print_ranges(saved.value());
  return 0;
}

int run_init(std::vector<std::string> args) {
  if (reject_extra_args(args, "init")) {
    return 1;
  }
  const auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  if (config::config_exists()) {
    std::cout << "Config already exists: " << path.value().string() << "\n";
    return 0;
  }
  if (auto saved = config::save_config(config::Config{}); !saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Wrote " << path.value().string() << "\n";
  std::cout << "Set TELEGRAM_BOT_TOKEN and TELEGRAM_CHAT_ID (or edit the file) before `slotwatch run`.\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_poll_loop(std::move(args));
  }
  if (subcommand == "once") {
    return run_once(std::move(args));
  }
  if (subcommand == "preview") {
    return run_preview(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace slotwatch::cli
