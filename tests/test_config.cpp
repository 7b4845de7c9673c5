#include "test_framework.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

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
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = slotkeeper::config::config_path_override();
    if (next.has_value()) {
      slotkeeper::config::set_config_path_override(*next);
    } else {
      slotkeeper::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      slotkeeper::config::set_config_path_override(*old_override);
    } else {
      slotkeeper::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("slotkeeper-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

/// Clears every variable that would leak the caller's environment into a test.
struct CleanEnv {
  EnvGuard config_path{"SLOTKEEPER_CONFIG_PATH", std::nullopt};
  EnvGuard db_path{"SLOTKEEPER_DB_PATH", std::nullopt};
  EnvGuard observability{"SLOTKEEPER_OBSERVABILITY", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<slotkeeper::tests::TestCase> &tests) {
  using slotkeeper::tests::require;
  namespace cfg = slotkeeper::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value() == home / ".slotkeeper", "config lives under ~/.slotkeeper");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.store.backend == "sqlite", "default backend should be sqlite");
                     require(config.availability.slot_step_minutes == 30, "default step");
                     require(config.availability.search_horizon_days == 30, "default horizon");
                     require(config.availability.cache_enabled, "cache on by default");
                     require(config.observability.backend == "log", "log observer by default");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());

                     write_file(path.value(),
                                R"(
[store]
backend = "sqlite"
path = "/var/lib/slotkeeper/schedule.db"

[availability]
slot_step_minutes = 15
search_horizon_days = 60
cache_enabled = false

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.store.path == "/var/lib/slotkeeper/schedule.db", "store path");
                     require(config.availability.slot_step_minutes == 15, "step from file");
                     require(config.availability.search_horizon_days == 60, "horizon from file");
                     require(config.availability.max_range_days == 93,
                             "missing keys keep their defaults");
                     require(!config.availability.cache_enabled, "cache flag from file");
                     require(config.observability.backend == "none", "observer from file");
                   }});

  tests.push_back({"save_config_round_trips", [] {
                     const CleanEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "custom.toml");

                     cfg::Config config;
                     config.store.path = (home / "db.sqlite").string();
                     config.availability.max_range_days = 31;
                     config.observability.backend = "log,none";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(std::filesystem::exists(home / "custom.toml"), "override path used");
                     require(!std::filesystem::exists(home / "custom.toml.tmp"),
                             "temporary file replaced");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path == config.store.path, "path survives");
                     require(loaded.value().availability.max_range_days == 31, "range survives");
                     require(loaded.value().observability.backend == "log,none",
                             "observer list survives");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto home = make_temp_home();
                     const EnvGuard env_path("SLOTKEEPER_CONFIG_PATH", (home / "env.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "env.toml", "env var selects the config file");

                     const EnvGuard env_dir("SLOTKEEPER_CONFIG_PATH", home.string());
                     const auto dir_path = cfg::config_path();
                     require(dir_path.ok(), dir_path.error());
                     require(dir_path.value() == home / "config.toml",
                             "a directory override gets the default file name");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     const CleanEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", "[store]\npath = \"/from/file.db\"\n");
                     const EnvGuard env_db("SLOTKEEPER_DB_PATH", "/from/env.db");
                     const EnvGuard env_obs("SLOTKEEPER_OBSERVABILITY", "none");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path == "/from/env.db", "db path from env");
                     require(loaded.value().observability.backend == "none", "observer from env");
                   }});

  tests.push_back({"load_config_rejects_malformed_toml", [] {
                     const CleanEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", "[store\npath = \n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed toml should fail");
                   }});

  tests.push_back({"load_config_rejects_mistyped_and_duplicate_keys", [] {
                     const CleanEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");

                     write_file(home / "config.toml",
                                "[availability]\nslot_step_minutes = \"thirty\"\n");
                     const auto mistyped = cfg::load_config();
                     require(!mistyped.ok(), "string for an integer key should fail");
                     require(mistyped.error().find("slot_step_minutes") != std::string::npos,
                             "error names the key");

                     write_file(home / "config.toml", "[availability]\ncache_enabled = yes\n");
                     require(!cfg::load_config().ok(), "non-boolean flag should fail");

                     write_file(home / "config.toml",
                                "[store]\npath = \"/a.db\"\npath = \"/b.db\"\n");
                     const auto duplicate = cfg::load_config();
                     require(!duplicate.ok(), "duplicate key should fail");
                     require(duplicate.code() == slotkeeper::common::ErrorCode::InvalidConfig,
                             "wrong error code");
                   }});

  tests.push_back({"validate_config_errors_and_warnings", [] {
                     cfg::Config config;
                     const auto defaults = cfg::validate_config(config);
                     require(defaults.ok(), defaults.error());
                     require(defaults.value().empty(), "defaults produce no warnings");

                     auto bad_backend = config;
                     bad_backend.store.backend = "postgres";
                     require(!cfg::validate_config(bad_backend).ok(), "only sqlite is supported");

                     auto bad_step = config;
                     bad_step.availability.slot_step_minutes = 0;
                     const auto step = cfg::validate_config(bad_step);
                     require(step.code() == slotkeeper::common::ErrorCode::InvalidConfig,
                             "zero step is invalid");

                     auto bad_observer = config;
                     bad_observer.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(bad_observer).ok(), "unknown observer");

                     auto noisy = config;
                     noisy.availability.slot_step_minutes = 90;
                     noisy.availability.cache_enabled = false;
                     const auto warned = cfg::validate_config(noisy);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 2, "two warnings");
                   }});
}
