#include "skillgov/skills/memory_source.hpp"

#include <iterator>

namespace skillgov::skills {

common::Status MemorySkillSource::add(const std::string &skill_name, const std::string &version,
                                      std::string content) {
  if (!is_valid_skill_name(skill_name)) {
    return common::Status::error("invalid skill name: " + skill_name);
  }
  auto parsed = Version::parse(version);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  catalog_[skill_name][parsed.value()] = std::move(content);
  return common::Status::success();
}

bool MemorySkillSource::remove(const std::string &skill_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.erase(skill_name) > 0;
}

SkillResult<FetchedSkill> MemorySkillSource::fetch(const FetchRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto skill_it = catalog_.find(request.name);
  if (skill_it == catalog_.end() || skill_it->second.empty()) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::NotFound, "Skill not found: " + request.name));
  }

  const auto &versions = skill_it->second;
  auto version_it = std::prev(versions.end());
  if (request.version.has_value()) {
    auto wanted = Version::parse(*request.version);
    if (!wanted.ok()) {
      return SkillResult<FetchedSkill>::failure(
          make_error(SkillErrorCode::InvalidVersion, wanted.error()));
    }
    version_it = versions.find(wanted.value());
    if (version_it == versions.end()) {
      return SkillResult<FetchedSkill>::failure(make_error(
          SkillErrorCode::NotFound, request.name + " has no version " + *request.version));
    }
  }

  FetchedSkill fetched;
  fetched.content = version_it->second;
  fetched.declared_version = version_it->first.to_string();
  fetched.origin = "memory://" + request.name + "@" + fetched.declared_version;
  return SkillResult<FetchedSkill>::success(std::move(fetched));
}

common::Result<std::vector<std::string>> MemorySkillSource::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(catalog_.size());
  for (const auto &[skill_name, versions] : catalog_) {
    if (!versions.empty()) {
      names.push_back(skill_name);
    }
  }
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

} // namespace skillgov::skills
