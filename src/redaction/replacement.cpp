#include "redaction/replacement.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <format>
#include <random>

namespace redactor {

namespace {

std::string to_base36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";

    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

} // anonymous namespace

std::string ReplacementEngine::replace(std::string_view match, ReplacementStrategy strategy) {
    switch (strategy) {
        case ReplacementStrategy::MASK:
            return mask(match);

        case ReplacementStrategy::HASH:
            return hash_value(match);

        case ReplacementStrategy::REMOVE:
            return std::string(kRemovedMarker);

        case ReplacementStrategy::TOKENIZE:
            return generate_token();
    }
    return std::string(kRemovedMarker);
}

std::string ReplacementEngine::mask(std::string_view match) {
    return std::string(utils::utf8_length(match), kMaskChar);
}

std::string ReplacementEngine::hash_value(std::string_view match) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(match.data()),
           match.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(kHashPrefixLen);
    for (size_t i = 0; i < kHashPrefixLen / 2; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

std::string ReplacementEngine::generate_token() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    return std::format("[TOKEN_{}_{}]",
        utils::epoch_millis(utils::now()), to_base36(dis(gen)));
}

} // namespace redactor
