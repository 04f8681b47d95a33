#pragma once

#include "skillgov/config/schema.hpp"
#include "skillgov/observability/observer.hpp"

#include <memory>
#include <string>

namespace skillgov::observability {

/// `backends` is a comma list of `log` and `none`/`noop`. Unknown names fall
/// back to `log`; repeated names are created once; several backends are
/// wrapped in a MultiObserver.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backends);

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace skillgov::observability
