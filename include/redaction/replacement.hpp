#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace redactor {

/**
 * @brief Replacement strategy dispatcher - turns one matched substring
 *        into its redacted form
 *
 * Strategies:
 * - MASK:     '*' repeated once per character (UTF-8 code point) of the match
 * - HASH:     SHA256 first 16 hex chars (deterministic, correlatable)
 * - REMOVE:   Fixed "[REDACTED]" marker
 * - TOKENIZE: "[TOKEN_<epoch-ms>_<base36>]", different on every call
 *
 * None of the strategies is reversible. TOKENIZE keeps no mapping back to
 * the original text.
 */
class ReplacementEngine {
public:
    static constexpr char kMaskChar = '*';
    static constexpr std::string_view kRemovedMarker = "[REDACTED]";
    static constexpr size_t kHashPrefixLen = 16;

    /**
     * @brief Redact a single matched value
     */
    [[nodiscard]] static std::string replace(std::string_view match, ReplacementStrategy strategy);

    [[nodiscard]] static std::string mask(std::string_view match);
    [[nodiscard]] static std::string hash_value(std::string_view match);
    [[nodiscard]] static std::string generate_token();
};

} // namespace redactor
