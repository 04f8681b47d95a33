#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace skillgov::budget {

struct BudgetRecord {
  std::string skill_name;
  std::uint64_t allocated = 0;
  std::uint64_t used = 0;
  int priority = 1;

  [[nodiscard]] std::uint64_t remaining() const { return allocated > used ? allocated - used : 0; }

  /// used / allocated, or 0 when nothing is allocated.
  [[nodiscard]] double utilization() const {
    if (allocated == 0) {
      return 0.0;
    }
    return static_cast<double>(used) / static_cast<double>(allocated);
  }
};

struct UsageSnapshot {
  std::string skill_name;
  std::uint64_t allocated = 0;
  std::uint64_t used = 0;
  double utilization = 0.0;
  std::chrono::system_clock::time_point released_at;
};

} // namespace skillgov::budget
