#pragma once

#include "skillgov/common/result.hpp"
#include "skillgov/skills/error.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace skillgov::skills {

struct FetchRequest {
  std::string name;
  std::optional<std::string> version;
  std::stop_token stop;
};

struct FetchedSkill {
  std::string content;
  /// Empty when the source has no explicit version; the content marker is used instead.
  std::string declared_version;
  std::string origin;
};

/// Implementations must be safe to call from several threads at once.
class ISkillSource {
public:
  virtual ~ISkillSource() = default;

  [[nodiscard]] virtual SkillResult<FetchedSkill> fetch(const FetchRequest &request) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>> list() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] bool is_valid_skill_name(const std::string &name);

} // namespace skillgov::skills
