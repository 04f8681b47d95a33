#include "skillgov/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace skillgov::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char byte : digest) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

} // namespace skillgov::common
