#include "skillgov/skills/directory_source.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/skills/version.hpp"

#include <algorithm>

namespace skillgov::skills {

namespace {

constexpr const char *SKILL_FILENAME = "SKILL.md";
constexpr const char *PROMPTS_DIR = "prompts";

std::vector<std::filesystem::path> sorted_prompt_files(const std::filesystem::path &skill_dir) {
  std::vector<std::filesystem::path> files;
  const auto prompts = skill_dir / PROMPTS_DIR;
  std::error_code ec;
  if (!std::filesystem::is_directory(prompts, ec)) {
    return files;
  }
  for (const auto &entry : std::filesystem::directory_iterator(prompts, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".md") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

DirectorySkillSource::DirectorySkillSource(std::filesystem::path root) : root_(std::move(root)) {}

std::optional<std::filesystem::path>
DirectorySkillSource::resolve_skill_dir(const std::string &skill_name,
                                        const std::optional<std::string> &version) const {
  std::error_code ec;
  const auto base = root_ / skill_name;
  if (version.has_value() && !common::trim(*version).empty()) {
    std::string folder = common::trim(*version);
    if (folder.front() != 'v') {
      folder.insert(folder.begin(), 'v');
    }
    const auto versioned = base / folder;
    if (std::filesystem::is_directory(versioned, ec)) {
      return versioned;
    }
  }
  if (std::filesystem::is_directory(base, ec)) {
    return base;
  }
  return std::nullopt;
}

SkillResult<FetchedSkill> DirectorySkillSource::fetch(const FetchRequest &request) {
  if (!is_valid_skill_name(request.name)) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::InvalidRequest, "invalid skill name: " + request.name));
  }

  const auto skill_dir = resolve_skill_dir(request.name, request.version);
  if (!skill_dir.has_value()) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::NotFound, "Skill not found: " + request.name));
  }

  const auto skill_md = *skill_dir / SKILL_FILENAME;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(skill_md, ec)) {
    return SkillResult<FetchedSkill>::failure(make_error(
        SkillErrorCode::NotFound, "SKILL.md not found in " + skill_dir->string()));
  }

  auto body = common::read_text_file(skill_md);
  if (!body.ok()) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::UnexpectedFault, body.error()));
  }

  FetchedSkill fetched;
  fetched.content = std::move(body.value());
  fetched.declared_version = find_version_marker(fetched.content).value_or("");
  fetched.origin = skill_dir->string();

  for (const auto &prompt_file : sorted_prompt_files(*skill_dir)) {
    if (request.stop.stop_requested()) {
      return SkillResult<FetchedSkill>::failure(
          make_error(SkillErrorCode::Cancelled, "fetch cancelled: " + request.name));
    }
    auto prompt = common::read_text_file(prompt_file);
    if (!prompt.ok()) {
      return SkillResult<FetchedSkill>::failure(
          make_error(SkillErrorCode::UnexpectedFault, prompt.error()));
    }
    fetched.content += "\n\n## Prompt: " + prompt_file.stem().string() + "\n" + prompt.value();
  }

  return SkillResult<FetchedSkill>::success(std::move(fetched));
}

common::Result<std::vector<std::string>> DirectorySkillSource::list() {
  std::vector<std::string> names;
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return common::Result<std::vector<std::string>>::success(std::move(names));
  }

  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    return common::Result<std::vector<std::string>>::failure("failed to list " + root_.string() +
                                                             ": " + ec.message());
  }
  for (const auto &entry : it) {
    if (!entry.is_directory(ec)) {
      continue;
    }
    if (std::filesystem::is_regular_file(entry.path() / SKILL_FILENAME, ec)) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

} // namespace skillgov::skills
