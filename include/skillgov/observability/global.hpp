#pragma once

#include "skillgov/observability/observer.hpp"

#include <memory>
#include <string>

namespace skillgov::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_skill_transition(const std::string &skill, const std::string &event_type,
                             const std::string &from_state, const std::string &to_state,
                             const std::string &version);
void record_budget_grant(const std::string &skill, std::uint64_t requested, std::uint64_t granted,
                         std::uint64_t reclaimed, int priority);
void record_budget_rebalance(std::size_t shrunk, std::size_t expanded,
                             std::uint64_t total_allocated);
void record_error(const std::string &component, const std::string &message);

} // namespace skillgov::observability
