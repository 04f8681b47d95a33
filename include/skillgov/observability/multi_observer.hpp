#pragma once

#include "skillgov/observability/observer.hpp"

#include <memory>
#include <vector>

namespace skillgov::observability {

/// Fans records out to every child in insertion order. A child that throws
/// is reported on stderr and does not stop delivery to the others.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> children);

  void add(std::unique_ptr<IObserver> child);
  [[nodiscard]] std::size_t size() const { return children_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each_child(const char *what, Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace skillgov::observability
