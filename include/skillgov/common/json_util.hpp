#pragma once

#include <string>

namespace skillgov::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_quote(const std::string &value);

} // namespace skillgov::common
