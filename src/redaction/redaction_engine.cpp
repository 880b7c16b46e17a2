#include "redaction/redaction_engine.hpp"
#include "redaction/pattern_library.hpp"
#include "redaction/replacement.hpp"
#include "core/hashing.hpp"

#include <format>
#include <memory>
#include <set>

namespace redactor {

Result<RedactionResult> RedactionEngine::apply(
    std::string_view content, const Policy& policy) const {

    if (content.empty()) {
        return Result<RedactionResult>::error(
            ErrorCategory::VALIDATION_ERROR, "content is required");
    }
    if (!policy.is_active()) {
        return Result<RedactionResult>::error(
            ErrorCategory::POLICY_NOT_FOUND,
            std::format("Policy '{}' is {}", policy.id, policy_status_to_string(policy.status)));
    }

    RedactionResult result;

    // Integrity hash over the untouched input, before any rule runs
    result.original_hash = hashing::sha256_hex(content);
    if (result.original_hash.empty()) {
        return Result<RedactionResult>::error(
            ErrorCategory::INTERNAL_ERROR, "Failed to compute content hash");
    }

    std::string working(content);
    std::set<std::string> matched;
    std::set<std::string> matched_by_rules;

    // ---- Pass 1: custom rules, cumulative over working -------------------

    for (size_t i = 0; i < policy.redaction_rules.size(); ++i) {
        const auto& rule = policy.redaction_rules[i];

        std::unique_ptr<re2::RE2> custom;
        const re2::RE2* matcher = nullptr;

        if (rule.pattern_type == pattern_types::kCustomRegex) {
            if (rule.regex.empty()) {
                return Result<RedactionResult>::error(
                    ErrorCategory::CONFIG_ERROR,
                    std::format("Policy '{}' rule {}: custom_regex without an expression",
                                policy.id, i));
            }
            custom = PatternLibrary::compile_custom(rule.regex);
            if (!custom->ok()) {
                return Result<RedactionResult>::error(
                    ErrorCategory::CONFIG_ERROR,
                    std::format("Policy '{}' rule {}: invalid custom_regex: {}",
                                policy.id, i, custom->error()));
            }
            matcher = custom.get();
        } else if (const auto* builtin = PatternLibrary::instance().find(rule.pattern_type)) {
            matcher = builtin->regex.get();
        }

        // Unknown pattern type with no built-in: zero matches
        if (!matcher) continue;

        auto pass = substitute_all(working, *matcher, [&rule](std::string_view m) {
            return ReplacementEngine::replace(m, rule.replacement);
        });

        if (pass.count > 0) {
            working = std::move(pass.content);
            matched.insert(rule.pattern_type);
            matched_by_rules.insert(rule.pattern_type);
            result.hits.emplace_back(PassSource::RULE, rule.pattern_type, pass.count);
        }
        result.redaction_count += pass.count;
    }

    // ---- Pass 2: built-in PII detection ----------------------------------

    if (policy.has_category(data_categories::kPii)) {
        for (const auto& builtin : PatternLibrary::instance().builtins()) {
            const std::string name(builtin.name);
            if (options_.skip_builtin_after_rule && matched_by_rules.contains(name)) {
                continue;
            }

            auto pass = substitute_all(working, *builtin.regex, [&builtin](std::string_view) {
                return std::string(builtin.token);
            });

            if (pass.count > 0) {
                working = std::move(pass.content);
                matched.insert(name);
                result.hits.emplace_back(PassSource::BUILTIN, name, pass.count);
                result.redaction_count += pass.count;
            }
        }
    }

    result.redacted_content = std::move(working);
    result.patterns_matched.assign(matched.begin(), matched.end());
    return Result<RedactionResult>::ok(std::move(result));
}

} // namespace redactor
