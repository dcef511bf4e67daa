#pragma once

#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Loads `config.toml` (or returns defaults when it does not exist) and applies environment
/// overrides. Out-of-range thresholds are replaced by that guard's defaults.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);
[[nodiscard]] common::Status validate_thresholds(const ThresholdConfig &thresholds);

void apply_env_overrides(Config &config);

} // namespace clawguard::config
