#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace skillgov::observability {

struct SkillTransitionEvent {
  std::string skill;
  std::string event_type;
  std::string from_state;
  std::string to_state;
  std::string version;
};

struct BudgetGrantEvent {
  std::string skill;
  std::uint64_t requested = 0;
  std::uint64_t granted = 0;
  std::uint64_t reclaimed = 0;
  int priority = 1;
};

struct BudgetRebalanceEvent {
  std::size_t shrunk = 0;
  std::size_t expanded = 0;
  std::uint64_t total_allocated = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SkillTransitionEvent, BudgetGrantEvent, BudgetRebalanceEvent, ErrorEvent>;

struct ActiveSkillsMetric {
  std::uint64_t count = 0;
};

struct LoadedSkillsMetric {
  std::uint64_t count = 0;
};

struct ContextUsageMetric {
  std::uint64_t used = 0;
  std::uint64_t budget = 0;
};

struct BudgetAllocatedMetric {
  std::uint64_t allocated = 0;
  std::uint64_t total = 0;
};

using ObserverMetric = std::variant<ActiveSkillsMetric, LoadedSkillsMetric, ContextUsageMetric,
                                    BudgetAllocatedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace skillgov::observability
