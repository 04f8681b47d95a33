#pragma once

#include "skillgov/common/result.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace skillgov::skills {

struct Version {
  std::uint32_t major = 1;
  std::uint32_t minor = 0;
  std::uint32_t patch = 0;

  /// Accepts "1", "1.2", "1.2.3" with an optional leading 'v'; missing parts are zero.
  [[nodiscard]] static common::Result<Version> parse(const std::string &text);

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] bool compatible(const Version &other) const { return major == other.major; }

  auto operator<=>(const Version &) const = default;
};

[[nodiscard]] std::optional<std::string> find_version_marker(const std::string &content);

/// Version declared by the content's marker, 1.0.0 when absent or unparsable.
[[nodiscard]] Version version_from_content(const std::string &content);

} // namespace skillgov::skills
