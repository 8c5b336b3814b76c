/***
 * Name: pyspect::support::Sha256Hex
 * Purpose: Content hash of raw script bytes.
 * Inputs: Byte buffer
 * Outputs: Lowercase hex SHA-256 digest (64 characters)
 * Theory of Operation: One-shot EVP_Digest from OpenSSL libcrypto; throws
 *   exceptions::DigestError if the digest cannot be computed.
 */
#pragma once

#include <string>
#include <string_view>

namespace pyspect::support {

std::string Sha256Hex(std::string_view bytes);

}  // namespace pyspect::support
