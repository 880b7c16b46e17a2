#include "core/hashing.hpp"

#include <openssl/evp.h>

#include <memory>

namespace redactor::hashing {

std::string to_hex(const unsigned char* bytes, size_t len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += hex_chars[(bytes[i] >> 4) & 0x0F];
        hex += hex_chars[bytes[i] & 0x0F];
    }
    return hex;
}

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return "";
    }

    return to_hex(hash, hash_len);
}

} // namespace redactor::hashing
