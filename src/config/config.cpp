#include "slotkeeper/config/config.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace slotkeeper::config {

namespace {

using PathResult = common::Result<std::filesystem::path>;

constexpr const char *CONFIG_FOLDER = ".slotkeeper";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SLOTKEEPER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

/// Missing keys keep the current value; a present key of the wrong type is an error.
common::Status read_int(const common::TomlDocument &doc, const std::string &key, int &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  constexpr int NOT_AN_INT = std::numeric_limits<int>::min();
  const int parsed = doc.get_int(key, NOT_AN_INT);
  if (parsed == NOT_AN_INT) {
    return common::Status::error(common::ErrorCode::InvalidConfig, key + " must be an integer");
  }
  out = parsed;
  return common::Status::success();
}

common::Status read_bool(const common::TomlDocument &doc, const std::string &key, bool &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const bool as_true = doc.get_bool(key, true);
  const bool as_false = doc.get_bool(key, false);
  if (as_true != as_false) {
    return common::Status::error(common::ErrorCode::InvalidConfig,
                                 key + " must be true or false");
  }
  out = as_true;
  return common::Status::success();
}

bool is_known_observer(const std::string &name) {
  return name == "log" || name == "none" || name == "noop";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return PathResult::failure(common::ErrorCode::InvalidConfig,
                                   "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return PathResult::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return PathResult::success(*override_path / CONFIG_FILENAME);
    }
    return PathResult::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return PathResult::failure(cfg_dir.status());
  }
  return PathResult::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *db_path = std::getenv("SLOTKEEPER_DB_PATH"); db_path != nullptr && *db_path) {
    config.store.path = db_path;
  }
  if (const char *backend = std::getenv("SLOTKEEPER_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::InvalidConfig,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  config.store.backend = doc.get_string("store.backend", config.store.backend);
  config.store.path = doc.get_string("store.path", config.store.path);

  auto &availability = config.availability;
  for (const auto &status :
       {read_int(doc, "availability.slot_step_minutes", availability.slot_step_minutes),
        read_int(doc, "availability.search_horizon_days", availability.search_horizon_days),
        read_int(doc, "availability.max_range_days", availability.max_range_days),
        read_bool(doc, "availability.cache_enabled", availability.cache_enabled)}) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status);
    }
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorCode::InvalidConfig,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::InvalidConfig,
                                 "Unable to write temporary config file");
  }

  file << "[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";

  file << "\n[availability]\n";
  file << "slot_step_minutes = " << config.availability.slot_step_minutes << "\n";
  file << "search_horizon_days = " << config.availability.search_horizon_days << "\n";
  file << "max_range_days = " << config.availability.max_range_days << "\n";
  file << "cache_enabled = " << bool_to_toml(config.availability.cache_enabled) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorCode::InvalidConfig,
                                 "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::InvalidConfig,
                                 "Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::to_lower(common::trim(config.store.backend)) != "sqlite") {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "Invalid store.backend: " + config.store.backend);
  }
  if (common::trim(config.store.path).empty()) {
    return Warnings::failure(common::ErrorCode::InvalidConfig, "store.path must not be empty");
  }

  const auto &availability = config.availability;
  if (availability.slot_step_minutes <= 0) {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "availability.slot_step_minutes must be positive");
  }
  if (availability.search_horizon_days <= 0) {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "availability.search_horizon_days must be positive");
  }
  if (availability.max_range_days <= 0) {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "availability.max_range_days must be positive");
  }
  if (availability.slot_step_minutes > 60) {
    warnings.push_back("availability.slot_step_minutes above 60 skips most start times");
  }
  if (!availability.cache_enabled) {
    warnings.push_back("availability cache disabled; every query reads the store");
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty() && !is_known_observer(name)) {
      return Warnings::failure(common::ErrorCode::InvalidConfig,
                               "Invalid observability.backend: " + config.observability.backend);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace slotkeeper::config
