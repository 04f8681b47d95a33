#pragma once

#include <cstdint>
#include <string>

namespace skillgov::config {

struct LifecycleConfig {
  std::uint32_t max_loaded_skills = 20;
  std::uint32_t max_active_skills = 5;
  std::uint64_t context_budget = 10'000;
  std::uint64_t default_allocation = 2'000;
  std::uint64_t fetch_timeout_ms = 0;
  std::string over_budget = "reject";
};

struct BudgetConfig {
  std::uint64_t total_budget = 10'000;
  double shrink_below = 0.3;
  std::uint32_t shrink_percent = 70;
  double expand_above = 0.9;
  std::uint64_t usage_history_limit = 1'000;
};

struct SourceConfig {
  std::string kind = "directory";
  std::string skills_dir = "~/.skillgov/skills";
  std::string base_url;
  std::uint64_t timeout_ms = 10'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  LifecycleConfig lifecycle;
  BudgetConfig budget;
  SourceConfig source;
  ObservabilityConfig observability;
};

} // namespace skillgov::config
