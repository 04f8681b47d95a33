#pragma once

#include "skillgov/common/result.hpp"
#include "skillgov/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace skillgov::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

[[nodiscard]] common::Result<Config> load_config();

/// Returns warnings on success, or the first hard error.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace skillgov::config
