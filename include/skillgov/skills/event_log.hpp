#pragma once

#include "skillgov/skills/state.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillgov::skills {

enum class LifecycleEventType {
  Discover,
  Load,
  LoadError,
  Unload,
  Activate,
  Deactivate,
  Upgrade,
  UpgradeError,
  HookError,
};

[[nodiscard]] std::string_view lifecycle_event_type_to_string(LifecycleEventType type);

using EventMetadata = std::map<std::string, std::string>;

struct LifecycleEvent {
  std::uint64_t sequence = 0;
  std::string skill_name;
  LifecycleEventType type = LifecycleEventType::Load;
  std::chrono::system_clock::time_point timestamp;
  SkillState old_state = SkillState::Discovered;
  SkillState new_state = SkillState::Discovered;
  std::optional<std::string> version;
  EventMetadata metadata;
};

// Sequence numbers order events that share a timestamp.
class EventLog {
public:
  std::uint64_t append(std::string skill_name, LifecycleEventType type, SkillState old_state,
                       SkillState new_state, std::optional<std::string> version = std::nullopt,
                       EventMetadata metadata = {});

  [[nodiscard]] std::vector<LifecycleEvent> all() const;
  [[nodiscard]] std::vector<LifecycleEvent> for_skill(const std::string &skill_name) const;

  /// The n-th most recent event of `type` for `skill_name` (n = 1 is the latest).
  [[nodiscard]] std::optional<LifecycleEvent>
  nth_latest(const std::string &skill_name, LifecycleEventType type, std::size_t n) const;

  [[nodiscard]] std::size_t count(const std::string &skill_name, LifecycleEventType type) const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<LifecycleEvent> events_;
  std::uint64_t next_sequence_ = 1;
};

[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point timestamp);
[[nodiscard]] std::string events_to_json(const std::vector<LifecycleEvent> &events);

} // namespace skillgov::skills
