#pragma once

#include <re2/re2.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief A fixed PII category: its name, pass-two token and matcher
 */
struct BuiltinPattern {
    std::string_view name;              // "email", "phone", "ssn", "credit_card"
    std::string_view token;             // "[EMAIL_REDACTED]", ...
    std::unique_ptr<re2::RE2> regex;    // Case-insensitive, UTF-8
};

/**
 * @brief Immutable table of built-in PII patterns, keyed by category
 *
 * Built once on first use (function-local static) and never mutated.
 * RE2 objects are safe to share between threads and match in time linear
 * in the input, with no recursion, so arbitrarily long tokens in the
 * content cannot exhaust the stack.
 *
 * Order is significant: the built-in pass visits categories in the order
 * email, phone, ssn, credit_card.
 */
class PatternLibrary {
public:
    /// Memory budget for compiling one custom expression
    static constexpr int64_t kCustomMaxMem = 8LL << 20;

    [[nodiscard]] static const PatternLibrary& instance();

    /// Lookup by category name; nullptr for unknown names and custom_regex
    [[nodiscard]] const BuiltinPattern* find(std::string_view name) const;

    [[nodiscard]] const std::vector<BuiltinPattern>& builtins() const { return patterns_; }

    /**
     * @brief Compile a user-supplied expression the way custom rules are compiled
     *
     * Always returns an object; check ok() / error(). Expressions RE2 cannot
     * express (backreferences, lookaround) or that exceed kCustomMaxMem fail.
     */
    [[nodiscard]] static std::unique_ptr<re2::RE2> compile_custom(const std::string& expression);

    PatternLibrary(const PatternLibrary&) = delete;
    PatternLibrary& operator=(const PatternLibrary&) = delete;

private:
    /// Throws std::runtime_error if a built-in expression fails to compile
    PatternLibrary();

    std::vector<BuiltinPattern> patterns_;
};

} // namespace redactor
