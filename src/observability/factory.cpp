#include "skillgov/observability/factory.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/observability/log_observer.hpp"
#include "skillgov/observability/multi_observer.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace skillgov::observability {

namespace {

std::string canonical_backend(const std::string &entry) {
  const std::string name = common::to_lower(common::trim(entry));
  if (name.empty() || name == "none" || name == "noop") {
    return "noop";
  }
  return "log";
}

std::unique_ptr<IObserver> make_backend(const std::string &canonical) {
  if (canonical == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backends) {
  std::vector<std::string> selected;
  std::stringstream stream(backends);
  std::string entry;
  while (std::getline(stream, entry, ',')) {
    const std::string canonical = canonical_backend(entry);
    if (std::find(selected.begin(), selected.end(), canonical) == selected.end()) {
      selected.push_back(canonical);
    }
  }

  if (selected.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (selected.size() == 1) {
    return make_backend(selected.front());
  }
  auto multi = std::make_unique<MultiObserver>();
  for (const auto &canonical : selected) {
    multi->add(make_backend(canonical));
  }
  return multi;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config.observability.backend);
}

} // namespace skillgov::observability
