#pragma once

#include "slotwatch/common/result.hpp"
#include "slotwatch/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace slotwatch::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
void clear_config_path_override();

/// Snapshot location: snapshot.path when set, otherwise <config_dir>/snapshot.json.
[[nodiscard]] common::Result<std::filesystem::path> snapshot_path(const Config &config);

/// Read config.toml (defaults when absent), then .env files and environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on settings the poller cannot start without; returns non-fatal warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace slotwatch::config
