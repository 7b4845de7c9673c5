#pragma once

#include "slotkeeper/common/result.hpp"
#include <filesystem>
#include <string>

namespace slotkeeper::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Random lowercase hex string of `bytes` random bytes, used for record ids. Fails when the
/// OpenSSL generator cannot supply them.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string now_rfc3339();

} // namespace slotkeeper::common
