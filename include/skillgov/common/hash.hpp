#pragma once

#include <string>

namespace skillgov::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace skillgov::common
