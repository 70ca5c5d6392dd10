#include "slotwatch/config/config.hpp"

#include "slotwatch/common/fs.hpp"
#include "slotwatch/common/toml.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>

namespace slotwatch::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".slotwatch";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SNAPSHOT_FILENAME = "snapshot.json";
constexpr std::uint32_t MAX_LOOKAHEAD_DAYS = 90;

// Sorted for binary_search.
constexpr std::array<std::string_view, 13> KNOWN_KEYS = {
    "observability.backend", "poller.interval_secs", "poller.notify_retries",
    "poller.run_immediately", "snapshot.path", "source.base_url",
    "source.lookahead_days", "source.resource_id", "source.timeout_ms",
    "telegram.api_base", "telegram.bot_token", "telegram.chat_id",
    "telegram.timeout_ms"};

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SLOTWATCH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SLOTWATCH_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env first so set_env_if_missing keeps its values over the CWD copy.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

template <typename T> bool parse_unsigned(const std::string &raw, T &out) {
  const std::string value = common::trim(raw);
  T parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return false;
  }
  out = parsed;
  return true;
}

template <typename T> void override_unsigned(const char *name, T &target) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return;
  }
  if (!parse_unsigned(raw, target)) {
    std::cerr << "[config] ignoring " << name << "=" << raw << ": not a number\n";
  }
}

void override_string(const char *name, std::string &target) {
  if (const char *raw = std::getenv(name); raw != nullptr && *raw != '\0') {
    target = raw;
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_http_url(const std::string &url) {
  const std::string lowered = common::to_lower(url);
  return common::starts_with(lowered, "http://") || common::starts_with(lowered, "https://");
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<std::filesystem::path> snapshot_path(const Config &config) {
  if (!common::trim(config.snapshot.path).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.snapshot.path)));
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / SNAPSHOT_FILENAME);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  override_string("TELEGRAM_BOT_TOKEN", config.telegram.bot_token);
  override_string("TELEGRAM_CHAT_ID", config.telegram.chat_id);
  override_string("SLOTWATCH_API_BASE", config.source.base_url);
  override_string("SLOTWATCH_RESOURCE_ID", config.source.resource_id);
  override_string("SLOTWATCH_SNAPSHOT_PATH", config.snapshot.path);
  override_unsigned("SLOTWATCH_LOOKAHEAD_DAYS", config.source.lookahead_days);
  override_unsigned("SLOTWATCH_POLL_INTERVAL_SECS", config.poller.interval_secs);
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();
  for (const auto &key : doc.keys()) {
    if (!std::binary_search(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), std::string_view(key))) {
      std::cerr << "[config] ignoring unknown key " << key << "\n";
    }
  }

  Config config;
  config.source.base_url = expand_config_value(doc.get_string("source.base_url", config.source.base_url));
  config.source.resource_id =
      expand_config_value(doc.get_string("source.resource_id", config.source.resource_id));
  config.source.lookahead_days = static_cast<std::uint32_t>(
      doc.get_u64("source.lookahead_days", config.source.lookahead_days));
  config.source.timeout_ms = doc.get_u64("source.timeout_ms", config.source.timeout_ms);

  config.telegram.bot_token = expand_config_value(doc.get_string("telegram.bot_token"));
  config.telegram.chat_id = expand_config_value(doc.get_string("telegram.chat_id"));
  config.telegram.api_base =
      expand_config_value(doc.get_string("telegram.api_base", config.telegram.api_base));
  config.telegram.timeout_ms = doc.get_u64("telegram.timeout_ms", config.telegram.timeout_ms);

  config.poller.interval_secs = doc.get_u64("poller.interval_secs", config.poller.interval_secs);
  config.poller.notify_retries = static_cast<std::uint32_t>(
      doc.get_u64("poller.notify_retries", config.poller.notify_retries));
  config.poller.run_immediately =
      doc.get_bool("poller.run_immediately", config.poller.run_immediately);

  config.snapshot.path = expand_config_value(doc.get_string("snapshot.path"));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  Config config;
  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "[source]\n";
  file << "base_url = " << common::quote_toml_string(config.source.base_url) << "\n";
  file << "resource_id = " << common::quote_toml_string(config.source.resource_id) << "\n";
  file << "lookahead_days = " << config.source.lookahead_days << "\n";
  file << "timeout_ms = " << config.source.timeout_ms << "\n";

  file << "\n[telegram]\n";
  file << "# Leave empty to use TELEGRAM_BOT_TOKEN / TELEGRAM_CHAT_ID from the environment.\n";
  file << "bot_token = " << common::quote_toml_string(config.telegram.bot_token) << "\n";
  file << "chat_id = " << common::quote_toml_string(config.telegram.chat_id) << "\n";
  file << "api_base = " << common::quote_toml_string(config.telegram.api_base) << "\n";
  file << "timeout_ms = " << config.telegram.timeout_ms << "\n";

  file << "\n[poller]\n";
  file << "interval_secs = " << config.poller.interval_secs << "\n";
  file << "notify_retries = " << config.poller.notify_retries << "\n";
  file << "run_immediately = " << bool_to_toml(config.poller.run_immediately) << "\n";

  file << "\n[snapshot]\n";
  file << "path = " << common::quote_toml_string(config.snapshot.path) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.telegram.bot_token).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "telegram bot token is not set (TELEGRAM_BOT_TOKEN or telegram.bot_token)");
  }
  if (common::trim(config.telegram.chat_id).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "telegram chat id is not set (TELEGRAM_CHAT_ID or telegram.chat_id)");
  }
  if (!is_http_url(config.telegram.api_base)) {
    return common::Result<std::vector<std::string>>::failure("Invalid telegram.api_base: " +
                                                              config.telegram.api_base);
  }
  if (!is_http_url(config.source.base_url)) {
    return common::Result<std::vector<std::string>>::failure("Invalid source.base_url: " +
                                                              config.source.base_url);
  }
  if (common::trim(config.source.resource_id).empty()) {
    return common::Result<std::vector<std::string>>::failure("source.resource_id is empty");
  }
  if (config.source.lookahead_days == 0 || config.source.lookahead_days > MAX_LOOKAHEAD_DAYS) {
    return common::Result<std::vector<std::string>>::failure(
        "source.lookahead_days must be between 1 and " + std::to_string(MAX_LOOKAHEAD_DAYS));
  }
  if (config.poller.interval_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "poller.interval_secs must be greater than 0");
  }

  if (config.poller.interval_secs < 60) {
    warnings.push_back("poller.interval_secs below 60 may hit upstream rate limits");
  }
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend.find("log") == std::string::npos &&
      backend.find("none") == std::string::npos && backend.find("noop") == std::string::npos) {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace slotwatch::config
