#pragma once

#include <cstdint>
#include <string>

namespace slotwatch::config {

struct SourceConfig {
  std::string base_url = "https://api.hel.fi/respa/v1";
  std::string resource_id = "axwzr3i57yba";
  std::uint32_t lookahead_days = 14;
  std::uint64_t timeout_ms = 30'000;
};

struct TelegramConfig {
  std::string bot_token;
  std::string chat_id;
  std::string api_base = "https://api.telegram.org";
  std::uint64_t timeout_ms = 15'000;
};

struct PollerConfig {
  std::uint64_t interval_secs = 600;
  std::uint32_t notify_retries = 2;
  bool run_immediately = true;
};

struct SnapshotConfig {
  // Empty means <config_dir>/snapshot.json.
  std::string path;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SourceConfig source;
  TelegramConfig telegram;
  PollerConfig poller;
  SnapshotConfig snapshot;
  ObservabilityConfig observability;
};

} // namespace slotwatch::config
