#include "skillgov/observability/global.hpp"

#include <mutex>

namespace skillgov::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_skill_transition(const std::string &skill, const std::string &event_type,
                             const std::string &from_state, const std::string &to_state,
                             const std::string &version) {
  record_event(SkillTransitionEvent{.skill = skill,
                                   .event_type = event_type,
                                   .from_state = from_state,
                                   .to_state = to_state,
                                   .version = version});
}

void record_budget_grant(const std::string &skill, const std::uint64_t requested,
                         const std::uint64_t granted, const std::uint64_t reclaimed,
                         const int priority) {
  record_event(BudgetGrantEvent{.skill = skill,
                                .requested = requested,
                                .granted = granted,
                                .reclaimed = reclaimed,
                                .priority = priority});
}

void record_budget_rebalance(const std::size_t shrunk, const std::size_t expanded,
                             const std::uint64_t total_allocated) {
  record_event(BudgetRebalanceEvent{
      .shrunk = shrunk, .expanded = expanded, .total_allocated = total_allocated});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace skillgov::observability
