#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace slotkeeper::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads the config file (defaults when it does not exist) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on invalid settings; otherwise returns non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace slotkeeper::config
