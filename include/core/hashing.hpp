#pragma once

#include <string>
#include <string_view>

namespace redactor::hashing {

/**
 * @brief SHA-256 of data as 64 lowercase hex chars (OpenSSL EVP)
 * @return Empty string if the digest could not be computed
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Lowercase hex encoding of a raw byte buffer
[[nodiscard]] std::string to_hex(const unsigned char* bytes, size_t len);

} // namespace redactor::hashing
