#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotwatch/cli/commands.hpp"
#include "slotwatch/common/fs.hpp"
#include "slotwatch/config/config.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Temporary HOME without credentials; drops any --config override on exit.
struct CliSandbox {
  slotwatch::testing::TempWorkspace home;
  std::deque<EnvGuard> guards;

  CliSandbox() {
    guards.emplace_back("HOME", home.path().string());
    for (const char *key : {"SLOTWATCH_CONFIG_PATH", "SLOTWATCH_ENV_FILE", "TELEGRAM_BOT_TOKEN",
                            "TELEGRAM_CHAT_ID", "SLOTWATCH_SNAPSHOT_PATH"}) {
      guards.emplace_back(key, std::nullopt);
    }
    slotwatch::config::clear_config_path_override();
  }

  ~CliSandbox() { slotwatch::config::clear_config_path_override(); }
};

int invoke(std::vector<std::string> args) {
  args.insert(args.begin(), "slotwatch");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return slotwatch::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

void register_cli_tests(std::vector<slotwatch::tests::TestCase> &tests) {
  using slotwatch::tests::require;

  tests.push_back({"cli_help_and_version_succeed", [] {
                     const CliSandbox sandbox;
                     require(invoke({}) == 0, "no arguments prints help");
                     require(invoke({"help"}) == 0, "help");
                     require(invoke({"--version"}) == 0, "version flag");
                     require(invoke({"version"}) == 0, "version command");
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     const CliSandbox sandbox;
                     require(invoke({"frobnicate"}) == 1, "unknown command");
                     require(invoke({"--config"}) == 1, "--config without value");
                     require(invoke({"status", "extra"}) == 1, "unexpected argument");
                   }});

  tests.push_back({"cli_init_writes_default_config_once", [] {
                     const CliSandbox sandbox;
                     const auto path = sandbox.home.path() / "custom" / "slotwatch.toml";
                     require(invoke({"--config", path.string(), "init"}) == 0, "init succeeds");
                     require(std::filesystem::exists(path), "config written to --config path");
                     const auto first = slotwatch::common::read_file(path);
                     require(first.ok(), first.error());
                     require(first.value().find("resource_id = \"axwzr3i57yba\"") != std::string::npos,
                             first.value());

                     require(invoke({"--config=" + path.string(), "init"}) == 0,
                             "second init is a no-op");
                     const auto second = slotwatch::common::read_file(path);
                     require(second.ok() && second.value() == first.value(), "file unchanged");
                   }});

  tests.push_back({"cli_run_and_once_require_telegram_settings", [] {
                     const CliSandbox sandbox;
                     require(invoke({"run", "--duration-secs", "1"}) == 1,
                             "run refuses to start without a token");
                     require(invoke({"once"}) == 1, "once refuses to start without a token");
                     require(!std::filesystem::exists(sandbox.home.path() / ".slotwatch" /
                                                      "slotwatch.pid"),
                             "no pid file left behind");
                   }});

  tests.push_back({"cli_run_rejects_bad_duration", [] {
                     const CliSandbox sandbox;
                     require(invoke({"run", "--duration-secs", "soon"}) == 1, "non-numeric duration");
                   }});

  tests.push_back({"cli_status_prints_saved_snapshot", [] {
                     const CliSandbox sandbox;
                     sandbox.home.create_file(
                         ".slotwatch/snapshot.json",
                         R"({"written_at":"2023-12-01T00:00:00Z","available":[)"
                         R"({"start":"2023-12-01T08:00:00+02:00","end":"2023-12-01T10:00:00+02:00"}]})");
                     require(invoke({"status"}) == 0, "status succeeds");
                     require(invoke({"config-path"}) == 0, "config-path succeeds");
                   }});
}
