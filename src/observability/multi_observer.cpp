#include "skillgov/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace skillgov::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> children) {
  for (auto &child : children) {
    add(std::move(child));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> child) {
  if (child != nullptr) {
    children_.push_back(std::move(child));
  }
}

template <typename Fn> void MultiObserver::for_each_child(const char *what, Fn &&fn) {
  for (auto &child : children_) {
    try {
      fn(*child);
    } catch (const std::exception &ex) {
      std::cerr << "[ERROR] observability: " << child->name() << " " << what
                << " failed: " << ex.what() << "\n";
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_child("record_event", [&](IObserver &child) { child.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_child("record_metric", [&](IObserver &child) { child.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_child("flush", [](IObserver &child) { child.flush(); });
}

} // namespace skillgov::observability
