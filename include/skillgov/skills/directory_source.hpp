#pragma once

#include "skillgov/skills/source.hpp"

#include <filesystem>

namespace skillgov::skills {

class DirectorySkillSource final : public ISkillSource {
public:
  explicit DirectorySkillSource(std::filesystem::path root);

  [[nodiscard]] SkillResult<FetchedSkill> fetch(const FetchRequest &request) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "directory"; }

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  [[nodiscard]] std::optional<std::filesystem::path>
  resolve_skill_dir(const std::string &skill_name, const std::optional<std::string> &version) const;

  std::filesystem::path root_;
};

} // namespace skillgov::skills
