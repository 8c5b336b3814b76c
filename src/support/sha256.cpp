/***
 * Name: pyspect::support::Sha256Hex
 * Purpose: Hash raw bytes with SHA-256 and render lowercase hex.
 * Theory of Operation: EVP_Digest performs init/update/final in one call; a
 *   zero return is surfaced as DigestError rather than an empty hash.
 */
#include "pyspect/support/sha256.h"
#include "pyspect/exceptions/digest_error.h"

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace pyspect::support {

std::string Sha256Hex(std::string_view bytes) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digestLen = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &digestLen, EVP_sha256(), nullptr) != 1) {
    throw exceptions::DigestError("sha256 digest failed");
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(digestLen) * 2);
  for (unsigned int i = 0; i < digestLen; ++i) {
    out.push_back(kHex[digest[i] >> 4U]);
    out.push_back(kHex[digest[i] & 0x0FU]);
  }
  return out;
}

} // namespace pyspect::support
