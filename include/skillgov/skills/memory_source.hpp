#pragma once

#include "skillgov/skills/source.hpp"
#include "skillgov/skills/version.hpp"

#include <map>
#include <mutex>

namespace skillgov::skills {

class MemorySkillSource final : public ISkillSource {
public:
  [[nodiscard]] common::Status add(const std::string &skill_name, const std::string &version,
                                   std::string content);
  [[nodiscard]] bool remove(const std::string &skill_name);

  [[nodiscard]] SkillResult<FetchedSkill> fetch(const FetchRequest &request) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::map<Version, std::string>> catalog_;
};

} // namespace skillgov::skills
