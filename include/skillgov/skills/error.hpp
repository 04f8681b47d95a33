#pragma once

#include "skillgov/common/result.hpp"

#include <string>
#include <string_view>

namespace skillgov::skills {

enum class SkillErrorCode {
  NotFound,
  InvalidVersion,
  IncompatibleVersion,
  BudgetExceeded,
  NotResident,
  NoRollbackTarget,
  InvalidRequest,
  Timeout,
  Cancelled,
  UnexpectedFault,
};

[[nodiscard]] std::string_view skill_error_code_to_string(SkillErrorCode code);

struct SkillError {
  SkillErrorCode code = SkillErrorCode::UnexpectedFault;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

template <typename T> using SkillResult = common::Result<T, SkillError>;
using SkillStatus = common::Result<void, SkillError>;

[[nodiscard]] inline SkillError make_error(SkillErrorCode code, std::string message) {
  return SkillError{.code = code, .message = std::move(message)};
}

} // namespace skillgov::skills
