#include "skillgov/skills/http_source.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/skills/version.hpp"

#include <algorithm>
#include <sstream>

namespace skillgov::skills {

HttpSkillSource::HttpSkillSource(std::string base_url, std::shared_ptr<net::HttpClient> client,
                                 const std::uint64_t timeout_ms, net::HttpHeaders headers)
    : base_url_(common::trim(base_url)), client_(std::move(client)), timeout_ms_(timeout_ms),
      headers_(std::move(headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string HttpSkillSource::url_for(const std::string &path) const {
  return base_url_ + "/" + path;
}

SkillResult<FetchedSkill> HttpSkillSource::fetch_url(const std::string &url,
                                                     const FetchRequest &request) const {
  const auto response = client_->get(url, headers_, timeout_ms_, request.stop);
  if (response.cancelled || request.stop.stop_requested()) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::Cancelled, "fetch cancelled: " + url));
  }
  if (response.timeout) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::Timeout, "timed out fetching " + url));
  }
  if (response.network_error) {
    return SkillResult<FetchedSkill>::failure(make_error(
        SkillErrorCode::UnexpectedFault, url + ": " + response.network_error_message));
  }
  if (response.status == 404) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::NotFound, "Skill not found: " + request.name));
  }
  if (response.status < 200 || response.status >= 300) {
    return SkillResult<FetchedSkill>::failure(make_error(
        SkillErrorCode::UnexpectedFault, url + " returned HTTP " + std::to_string(response.status)));
  }

  FetchedSkill fetched;
  fetched.content = response.body;
  fetched.declared_version = find_version_marker(fetched.content).value_or("");
  fetched.origin = url;
  return SkillResult<FetchedSkill>::success(std::move(fetched));
}

SkillResult<FetchedSkill> HttpSkillSource::fetch(const FetchRequest &request) {
  if (!is_valid_skill_name(request.name)) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::InvalidRequest, "invalid skill name: " + request.name));
  }
  if (client_ == nullptr) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::UnexpectedFault, "http source has no client"));
  }

  if (request.version.has_value() && !common::trim(*request.version).empty()) {
    std::string folder = common::trim(*request.version);
    if (folder.front() != 'v') {
      folder.insert(folder.begin(), 'v');
    }
    auto versioned = fetch_url(url_for(request.name + "/" + folder + "/SKILL.md"), request);
    if (versioned.ok() || versioned.error().code != SkillErrorCode::NotFound) {
      return versioned;
    }
  }
  return fetch_url(url_for(request.name + "/SKILL.md"), request);
}

common::Result<std::vector<std::string>> HttpSkillSource::list() {
  if (client_ == nullptr) {
    return common::Result<std::vector<std::string>>::failure("http source has no client");
  }
  const auto url = url_for("index.txt");
  const auto response = client_->get(url, headers_, timeout_ms_, {});
  if (response.network_error) {
    return common::Result<std::vector<std::string>>::failure(url + ": " +
                                                             response.network_error_message);
  }
  if (response.status == 404) {
    return common::Result<std::vector<std::string>>::success({});
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::vector<std::string>>::failure(
        url + " returned HTTP " + std::to_string(response.status));
  }

  std::vector<std::string> names;
  std::istringstream stream(response.body);
  std::string line;
  while (std::getline(stream, line)) {
    const std::string entry = common::trim(line);
    if (entry.empty() || entry.front() == '#' || !is_valid_skill_name(entry)) {
      continue;
    }
    names.push_back(entry);
  }
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

} // namespace skillgov::skills
