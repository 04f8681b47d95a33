#include "skillgov/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace skillgov::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SkillTransitionEvent>) {
          std::string line = "skill." + evt.event_type + " name=" + evt.skill + " state=" +
                             evt.from_state + "->" + evt.to_state;
          if (!evt.version.empty()) {
            line += " version=" + evt.version;
          }
          log_line(evt.event_type.ends_with("_error") ? "WARN" : "INFO", line);
        } else if constexpr (std::is_same_v<T, BudgetGrantEvent>) {
          log_line("DEBUG", "budget.grant name=" + evt.skill +
                                " requested=" + std::to_string(evt.requested) +
                                " granted=" + std::to_string(evt.granted) +
                                " reclaimed=" + std::to_string(evt.reclaimed) +
                                " priority=" + std::to_string(evt.priority));
        } else if constexpr (std::is_same_v<T, BudgetRebalanceEvent>) {
          log_line("DEBUG", "budget.rebalance shrunk=" + std::to_string(evt.shrunk) +
                                " expanded=" + std::to_string(evt.expanded) +
                                " total_allocated=" + std::to_string(evt.total_allocated));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveSkillsMetric>) {
          log_line("DEBUG", "metric.active_skills=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, LoadedSkillsMetric>) {
          log_line("DEBUG", "metric.loaded_skills=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ContextUsageMetric>) {
          log_line("DEBUG", "metric.context_usage=" + std::to_string(m.used) + "/" +
                                std::to_string(m.budget));
        } else if constexpr (std::is_same_v<T, BudgetAllocatedMetric>) {
          log_line("DEBUG", "metric.budget_allocated=" + std::to_string(m.allocated) + "/" +
                                std::to_string(m.total));
        }
      },
      metric);
}

} // namespace skillgov::observability
