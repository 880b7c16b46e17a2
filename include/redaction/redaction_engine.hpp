#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include <re2/re2.h>

#include <string>
#include <string_view>

namespace redactor {

/**
 * @brief Redaction engine - applies a privacy policy to free-form text
 *
 * Two ordered passes over one working copy of the content:
 * 1. Custom rules, in policy order. Each rule sees the output of the
 *    previous one and replaces its matches with the rule's strategy.
 * 2. Built-in PII detection (only when the policy lists "pii"): email,
 *    phone, ssn, credit_card, each replaced with its fixed token.
 *
 * The engine holds no mutable state. Custom regexes are compiled per call
 * and built-in ones come from the immutable PatternLibrary, so apply() may
 * run concurrently from any number of threads. All matching is RE2, which
 * runs in time linear in the content for every expression.
 *
 * Failures (no partial result is ever returned):
 * - VALIDATION_ERROR  empty content
 * - POLICY_NOT_FOUND  policy is not active
 * - CONFIG_ERROR      custom_regex missing, malformed, or too large to compile
 * - INTERNAL_ERROR    integrity hash could not be computed
 */
class RedactionEngine {
public:
    struct Options {
        /// Skip a built-in category in pass two when a custom rule of the
        /// same pattern type already matched in pass one.
        bool skip_builtin_after_rule = false;
    };

    RedactionEngine() = default;
    explicit RedactionEngine(Options options) : options_(options) {}

    [[nodiscard]] Result<RedactionResult> apply(std::string_view content, const Policy& policy) const;

    [[nodiscard]] const Options& options() const { return options_; }

    /// Outcome of replacing every match of one matcher
    struct Substitution {
        std::string content;
        size_t count = 0;
    };

    /**
     * @brief Replace every non-overlapping, non-empty match of re in input
     *
     * Each search resumes where the previous match ended, with the whole
     * input as context so \b sees the preceding character.
     */
    template<typename Replacer>
    [[nodiscard]] static Substitution substitute_all(
        const std::string& input, const re2::RE2& re, Replacer&& replacer) {

        Substitution out;
        out.content.reserve(input.size());

        const re2::StringPiece text(input.data(), input.size());
        re2::StringPiece m;
        size_t pos = 0;
        size_t last = 0;
        while (pos <= input.size() &&
               re.Match(text, pos, input.size(), re2::RE2::UNANCHORED, &m, 1)) {
            const size_t begin = static_cast<size_t>(m.data() - input.data());
            const size_t end = begin + m.size();

            // Empty matches are skipped rather than counted, so `x*` only
            // reports its non-empty runs
            if (m.empty()) {
                pos = end + 1;
                while (pos < input.size() && utils::is_utf8_continuation(input[pos])) ++pos;
                continue;
            }

            out.content.append(input, last, begin - last);
            out.content += replacer(std::string_view(m.data(), m.size()));
            last = end;
            pos = end;
            ++out.count;
        }
        out.content.append(input, last, std::string::npos);
        return out;
    }

private:
    Options options_;
};

} // namespace redactor
