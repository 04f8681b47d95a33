#include "skillgov/config/config.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <limits>

namespace skillgov::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".skillgov";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SKILLGOV_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

std::uint32_t clamp_u32(const std::uint64_t value) {
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return std::numeric_limits<std::uint32_t>::max();
  }
  return static_cast<std::uint32_t>(value);
}

bool within_unit_interval(const double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
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

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &lifecycle = config.lifecycle;
  lifecycle.max_loaded_skills =
      clamp_u32(doc.get_u64("lifecycle.max_loaded_skills", lifecycle.max_loaded_skills));
  lifecycle.max_active_skills =
      clamp_u32(doc.get_u64("lifecycle.max_active_skills", lifecycle.max_active_skills));
  lifecycle.context_budget = doc.get_u64("lifecycle.context_budget", lifecycle.context_budget);
  lifecycle.default_allocation =
      doc.get_u64("lifecycle.default_allocation", lifecycle.default_allocation);
  lifecycle.fetch_timeout_ms = doc.get_u64("lifecycle.fetch_timeout_ms", lifecycle.fetch_timeout_ms);
  lifecycle.over_budget =
      common::to_lower(doc.get_string("lifecycle.over_budget", lifecycle.over_budget));

  auto &budget = config.budget;
  // A lone [lifecycle] context_budget also sizes the allocator pool unless set explicitly.
  budget.total_budget = doc.get_u64("budget.total_budget", lifecycle.context_budget);
  budget.shrink_below = doc.get_double("budget.shrink_below", budget.shrink_below);
  budget.shrink_percent = clamp_u32(doc.get_u64("budget.shrink_percent", budget.shrink_percent));
  budget.expand_above = doc.get_double("budget.expand_above", budget.expand_above);
  budget.usage_history_limit =
      doc.get_u64("budget.usage_history_limit", budget.usage_history_limit);

  auto &source = config.source;
  source.kind = common::to_lower(doc.get_string("source.kind", source.kind));
  source.skills_dir = common::expand_path(doc.get_string("source.skills_dir", source.skills_dir));
  source.base_url = doc.get_string("source.base_url", source.base_url);
  source.timeout_ms = doc.get_u64("source.timeout_ms", source.timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const auto value = env_u64("SKILLGOV_MAX_LOADED_SKILLS"); value.has_value()) {
    config.lifecycle.max_loaded_skills = clamp_u32(*value);
  }
  if (const auto value = env_u64("SKILLGOV_MAX_ACTIVE_SKILLS"); value.has_value()) {
    config.lifecycle.max_active_skills = clamp_u32(*value);
  }
  if (const auto value = env_u64("SKILLGOV_CONTEXT_BUDGET"); value.has_value()) {
    config.lifecycle.context_budget = *value;
  }
  if (const auto value = env_u64("SKILLGOV_TOTAL_BUDGET"); value.has_value()) {
    config.budget.total_budget = *value;
  }
  if (const char *dir = std::getenv("SKILLGOV_SKILLS_DIR"); dir != nullptr && *dir != '\0') {
    config.source.skills_dir = common::expand_path(dir);
  }
  if (const char *backend = std::getenv("SKILLGOV_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.source.skills_dir = common::expand_path(config.source.skills_dir);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &lifecycle = config.lifecycle;
  if (lifecycle.max_loaded_skills == 0) {
    return ValidationResult::failure("lifecycle.max_loaded_skills must be at least 1");
  }
  if (lifecycle.max_active_skills == 0) {
    return ValidationResult::failure("lifecycle.max_active_skills must be at least 1");
  }
  if (lifecycle.max_active_skills > lifecycle.max_loaded_skills) {
    return ValidationResult::failure(
        "lifecycle.max_active_skills cannot exceed lifecycle.max_loaded_skills");
  }
  if (lifecycle.context_budget == 0) {
    return ValidationResult::failure("lifecycle.context_budget must be positive");
  }
  if (lifecycle.default_allocation == 0 ||
      lifecycle.default_allocation > lifecycle.context_budget) {
    return ValidationResult::failure(
        "lifecycle.default_allocation must be between 1 and lifecycle.context_budget");
  }
  if (lifecycle.over_budget != "reject" && lifecycle.over_budget != "allow") {
    return ValidationResult::failure("Invalid lifecycle.over_budget: " + lifecycle.over_budget);
  }

  const auto &budget = config.budget;
  if (budget.total_budget == 0) {
    return ValidationResult::failure("budget.total_budget must be positive");
  }
  if (!within_unit_interval(budget.shrink_below) || !within_unit_interval(budget.expand_above)) {
    return ValidationResult::failure(
        "budget.shrink_below and budget.expand_above must be between 0.0 and 1.0");
  }
  if (budget.shrink_below >= budget.expand_above) {
    return ValidationResult::failure("budget.shrink_below must be lower than budget.expand_above");
  }
  if (budget.shrink_percent == 0 || budget.shrink_percent > 100) {
    return ValidationResult::failure("budget.shrink_percent must be 1-100");
  }
  if (budget.total_budget != lifecycle.context_budget) {
    warnings.push_back("budget.total_budget differs from lifecycle.context_budget; "
                       "delegated activations are bounded by the smaller of the two");
  }
  if (budget.usage_history_limit == 0) {
    warnings.push_back("budget.usage_history_limit is 0; release snapshots are not kept");
  }

  const auto &source = config.source;
  if (source.kind != "directory" && source.kind != "http" && source.kind != "memory") {
    return ValidationResult::failure("Invalid source.kind: " + source.kind);
  }
  if (source.kind == "directory" && common::trim(source.skills_dir).empty()) {
    return ValidationResult::failure("source.skills_dir is required for the directory source");
  }
  if (source.kind == "http") {
    const std::string url = common::to_lower(common::trim(source.base_url));
    if (url.empty()) {
      return ValidationResult::failure("source.base_url is required for the http source");
    }
    if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
      return ValidationResult::failure("source.base_url must be an http(s) URL: " +
                                       source.base_url);
    }
    if (common::starts_with(url, "http://")) {
      warnings.push_back("source.base_url uses plain http");
    }
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace skillgov::config
