#include "skillgov/budget/allocator.hpp"

#include "skillgov/observability/global.hpp"

#include <algorithm>

namespace skillgov::budget {

BudgetOptions BudgetOptions::from_config(const config::BudgetConfig &config) {
  BudgetOptions options;
  options.total_budget = config.total_budget;
  options.shrink_below = config.shrink_below;
  options.shrink_percent = config.shrink_percent;
  options.expand_above = config.expand_above;
  options.usage_history_limit = static_cast<std::size_t>(config.usage_history_limit);
  return options;
}

BudgetAllocator::BudgetAllocator(BudgetOptions options) : options_(std::move(options)) {}

std::uint64_t BudgetAllocator::total_allocated_locked() const {
  std::uint64_t total = 0;
  for (const auto &[name, record] : records_) {
    (void)name;
    total += record.allocated;
  }
  return total;
}

std::uint64_t BudgetAllocator::available_locked() const {
  const std::uint64_t allocated = total_allocated_locked();
  return allocated >= options_.total_budget ? 0 : options_.total_budget - allocated;
}

std::uint64_t BudgetAllocator::reclaim_locked(const std::string &requester,
                                              const std::uint64_t shortfall, const int priority) {
  std::vector<BudgetRecord *> candidates;
  for (auto &[name, record] : records_) {
    if (name != requester && record.priority < priority && record.remaining() > 0) {
      candidates.push_back(&record);
    }
  }
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const BudgetRecord *a, const BudgetRecord *b) {
                     return a->priority < b->priority;
                   });

  std::uint64_t reclaimed = 0;
  for (auto *candidate : candidates) {
    if (reclaimed >= shortfall) {
      break;
    }
    const std::uint64_t take = std::min(candidate->remaining(), shortfall - reclaimed);
    candidate->allocated -= take;
    reclaimed += take;
  }
  return reclaimed;
}

std::uint64_t BudgetAllocator::allocate(const std::string &skill_name,
                                        const std::uint64_t requested, const int priority) {
  std::uint64_t granted = 0;
  std::uint64_t reclaimed = 0;
  std::uint64_t total_allocated = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // The new record replaces the old one, so the old grant is back in the pool.
    records_.erase(skill_name);

    granted = std::min(requested, available_locked());
    if (granted < requested && priority > 1) {
      reclaimed = reclaim_locked(skill_name, requested - granted, priority);
      granted += reclaimed;
    }

    records_[skill_name] = BudgetRecord{
        .skill_name = skill_name, .allocated = granted, .used = 0, .priority = priority};
    total_allocated = total_allocated_locked();
  }

  observability::record_budget_grant(skill_name, requested, granted, reclaimed, priority);
  observability::record_metric(observability::BudgetAllocatedMetric{
      .allocated = total_allocated, .total = options_.total_budget});
  return granted;
}

bool BudgetAllocator::use(const std::string &skill_name, const std::uint64_t tokens) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(skill_name);
  if (it == records_.end()) {
    return false;
  }
  if (it->second.remaining() < tokens) {
    return false;
  }
  it->second.used += tokens;
  return true;
}

bool BudgetAllocator::release(const std::string &skill_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(skill_name);
  if (it == records_.end()) {
    return false;
  }

  const auto &record = it->second;
  if (options_.usage_history_limit > 0) {
    usage_history_.push_back(UsageSnapshot{.skill_name = record.skill_name,
                                           .allocated = record.allocated,
                                           .used = record.used,
                                           .utilization = record.utilization(),
                                           .released_at = std::chrono::system_clock::now()});
    while (usage_history_.size() > options_.usage_history_limit) {
      usage_history_.pop_front();
    }
  }
  records_.erase(it);
  return true;
}

RebalanceReport BudgetAllocator::rebalance() {
  RebalanceReport report;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[name, record] : records_) {
      (void)name;
      const double utilization = record.utilization();
      if (utilization < options_.shrink_below) {
        const std::uint64_t shrunk = record.allocated * options_.shrink_percent / 100;
        if (shrunk < record.allocated) {
          record.allocated = shrunk;
          ++report.shrunk;
        }
      } else if (utilization > options_.expand_above) {
        // Pool headroom is re-read per record: earlier shrinks in this pass free tokens.
        const std::uint64_t expansion = std::min(available_locked() / 2, record.allocated);
        if (expansion > 0) {
          record.allocated += expansion;
          ++report.expanded;
        }
      }
    }
    report.total_allocated = total_allocated_locked();
  }

  observability::record_budget_rebalance(report.shrunk, report.expanded, report.total_allocated);
  observability::record_metric(observability::BudgetAllocatedMetric{
      .allocated = report.total_allocated, .total = options_.total_budget});
  return report;
}

std::optional<BudgetRecord> BudgetAllocator::get_budget(const std::string &skill_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(skill_name);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<BudgetRecord> BudgetAllocator::get_all_budgets() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<BudgetRecord> out;
  out.reserve(records_.size());
  for (const auto &[name, record] : records_) {
    (void)name;
    out.push_back(record);
  }
  return out;
}

std::uint64_t BudgetAllocator::get_total_allocated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_allocated_locked();
}

std::uint64_t BudgetAllocator::get_total_used() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t total = 0;
  for (const auto &[name, record] : records_) {
    (void)name;
    total += record.used;
  }
  return total;
}

std::uint64_t BudgetAllocator::get_available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_locked();
}

std::vector<UsageSnapshot> BudgetAllocator::get_usage_history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {usage_history_.begin(), usage_history_.end()};
}

} // namespace skillgov::budget
