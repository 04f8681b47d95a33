#pragma once

#include "skillgov/budget/record.hpp"
#include "skillgov/config/schema.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skillgov::budget {

struct BudgetOptions {
  std::uint64_t total_budget = 10'000;
  double shrink_below = 0.3;
  /// Shrunk records keep this percentage of their allocation (rounded down).
  std::uint32_t shrink_percent = 70;
  double expand_above = 0.9;
  std::size_t usage_history_limit = 1'000;

  [[nodiscard]] static BudgetOptions from_config(const config::BudgetConfig &config);
};

struct RebalanceReport {
  std::size_t shrunk = 0;
  std::size_t expanded = 0;
  std::uint64_t total_allocated = 0;
};

// A grant and the reclaim that funds it happen under one lock.
class BudgetAllocator {
public:
  explicit BudgetAllocator(BudgetOptions options = {});

  /// Priority above 1 may take unused tokens from strictly lower priorities.
  /// Replaces any previous record for `skill_name`.
  std::uint64_t allocate(const std::string &skill_name, std::uint64_t requested, int priority = 1);

  [[nodiscard]] bool use(const std::string &skill_name, std::uint64_t tokens);

  bool release(const std::string &skill_name);

  RebalanceReport rebalance();

  [[nodiscard]] std::optional<BudgetRecord> get_budget(const std::string &skill_name) const;
  [[nodiscard]] std::vector<BudgetRecord> get_all_budgets() const;
  [[nodiscard]] std::uint64_t get_total_allocated() const;
  [[nodiscard]] std::uint64_t get_total_used() const;
  [[nodiscard]] std::uint64_t get_available() const;
  [[nodiscard]] std::uint64_t total_budget() const { return options_.total_budget; }
  [[nodiscard]] std::vector<UsageSnapshot> get_usage_history() const;

private:
  [[nodiscard]] std::uint64_t total_allocated_locked() const;
  [[nodiscard]] std::uint64_t available_locked() const;
  std::uint64_t reclaim_locked(const std::string &requester, std::uint64_t shortfall,
                               int priority);

  const BudgetOptions options_;
  mutable std::mutex mutex_;
  std::map<std::string, BudgetRecord> records_;
  std::deque<UsageSnapshot> usage_history_;
};

} // namespace skillgov::budget
