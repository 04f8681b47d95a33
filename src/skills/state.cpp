#include "skillgov/skills/error.hpp"
#include "skillgov/skills/state.hpp"

namespace skillgov::skills {

std::string_view skill_state_to_string(const SkillState state) {
  switch (state) {
  case SkillState::Loaded:
    return "loaded";
  case SkillState::Active:
    return "active";
  case SkillState::Unloaded:
    return "unloaded";
  case SkillState::Error:
    return "error";
  case SkillState::Discovered:
  default:
    return "discovered";
  }
}

std::optional<SkillState> skill_state_from_string(const std::string_view value) {
  for (const auto state : {SkillState::Discovered, SkillState::Loaded, SkillState::Active,
                           SkillState::Unloaded, SkillState::Error}) {
    if (skill_state_to_string(state) == value) {
      return state;
    }
  }
  return std::nullopt;
}

std::string_view skill_error_code_to_string(const SkillErrorCode code) {
  switch (code) {
  case SkillErrorCode::NotFound:
    return "not_found";
  case SkillErrorCode::InvalidVersion:
    return "invalid_version";
  case SkillErrorCode::IncompatibleVersion:
    return "incompatible_version";
  case SkillErrorCode::BudgetExceeded:
    return "budget_exceeded";
  case SkillErrorCode::NotResident:
    return "not_resident";
  case SkillErrorCode::NoRollbackTarget:
    return "no_rollback_target";
  case SkillErrorCode::InvalidRequest:
    return "invalid_request";
  case SkillErrorCode::Timeout:
    return "timeout";
  case SkillErrorCode::Cancelled:
    return "cancelled";
  case SkillErrorCode::UnexpectedFault:
  default:
    return "unexpected_fault";
  }
}

std::string SkillError::to_string() const {
  std::string out(skill_error_code_to_string(code));
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

} // namespace skillgov::skills
