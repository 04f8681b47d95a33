#pragma once

#include <optional>
#include <string_view>

namespace skillgov::skills {

enum class SkillState {
  Discovered,
  Loaded,
  Active,
  Unloaded,
  Error,
};

[[nodiscard]] std::string_view skill_state_to_string(SkillState state);
[[nodiscard]] std::optional<SkillState> skill_state_from_string(std::string_view value);

[[nodiscard]] constexpr bool is_resident(const SkillState state) {
  return state == SkillState::Loaded || state == SkillState::Active;
}

} // namespace skillgov::skills
