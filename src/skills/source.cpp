#include "skillgov/skills/source.hpp"

#include <algorithm>

namespace skillgov::skills {

bool is_valid_skill_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return std::none_of(name.begin(), name.end(), [](const char ch) {
    return ch == '/' || ch == '\\' || ch == '\0';
  });
}

} // namespace skillgov::skills
