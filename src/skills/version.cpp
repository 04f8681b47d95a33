#include "skillgov/skills/version.hpp"

#include "skillgov/common/fs.hpp"

#include <charconv>
#include <regex>
#include <vector>

namespace skillgov::skills {

namespace {

std::optional<std::uint32_t> parse_component(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace

common::Result<Version> Version::parse(const std::string &text) {
  std::string value = common::trim(text);
  if (!value.empty() && (value.front() == 'v' || value.front() == 'V')) {
    value.erase(0, 1);
  }
  if (value.empty()) {
    return common::Result<Version>::failure("empty version string");
  }

  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = value.find('.', start);
    parts.push_back(value.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  if (parts.size() > 3) {
    return common::Result<Version>::failure("too many version components: " + text);
  }

  Version version{.major = 0, .minor = 0, .patch = 0};
  std::uint32_t *fields[] = {&version.major, &version.minor, &version.patch};
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto component = parse_component(parts[i]);
    if (!component.has_value()) {
      return common::Result<Version>::failure("invalid version: " + text);
    }
    *fields[i] = *component;
  }
  return common::Result<Version>::success(version);
}

std::string Version::to_string() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::optional<std::string> find_version_marker(const std::string &content) {
  static const std::regex marker(R"(version\s*[:=]\s*["']?(\d+\.\d+\.\d+)["']?)");
  std::smatch match;
  if (std::regex_search(content, match, marker)) {
    return match[1].str();
  }
  return std::nullopt;
}

Version version_from_content(const std::string &content) {
  if (const auto marker = find_version_marker(content); marker.has_value()) {
    if (auto parsed = Version::parse(*marker); parsed.ok()) {
      return parsed.value();
    }
  }
  return Version{};
}

} // namespace skillgov::skills
