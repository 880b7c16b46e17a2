#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace redactor {

// ============================================================================
// Basic Enums
// ============================================================================

enum class PolicyStatus {
    ACTIVE,
    INACTIVE,
    DRAFT,
    ARCHIVED
};

enum class ReplacementStrategy {
    MASK,       // Same-length run of '*'
    HASH,       // SHA-256 prefix (16 hex chars)
    REMOVE,     // Fixed "[REDACTED]" marker
    TOKENIZE    // Fresh opaque token per match, no reverse mapping
};

// ============================================================================
// Well-known names
// ============================================================================

namespace pattern_types {
    inline constexpr std::string_view kEmail       = "email";
    inline constexpr std::string_view kPhone       = "phone";
    inline constexpr std::string_view kSsn         = "ssn";
    inline constexpr std::string_view kCreditCard  = "credit_card";
    inline constexpr std::string_view kCustomRegex = "custom_regex";
}

namespace data_categories {
    inline constexpr std::string_view kPii         = "pii";
    inline constexpr std::string_view kFinancial   = "financial";
    inline constexpr std::string_view kHealth      = "health";
    inline constexpr std::string_view kBiometric   = "biometric";
    inline constexpr std::string_view kLocation    = "location";
    inline constexpr std::string_view kCredentials = "credentials";
    inline constexpr std::string_view kCustom      = "custom";
}

inline constexpr std::string_view kDefaultDataType = "prompt";

// ============================================================================
// Policy
// ============================================================================

struct RedactionRule {
    std::string pattern_type;           // email, phone, ssn, credit_card, custom_regex, ...
    std::string regex;                  // Only consulted for custom_regex
    ReplacementStrategy replacement = ReplacementStrategy::MASK;

    RedactionRule() = default;
    RedactionRule(std::string type, ReplacementStrategy r)
        : pattern_type(std::move(type)), replacement(r) {}
    RedactionRule(std::string type, std::string re, ReplacementStrategy r)
        : pattern_type(std::move(type)), regex(std::move(re)), replacement(r) {}
};

struct Policy {
    std::string id;
    std::string name;
    std::string description;
    std::string org_id;                 // Empty = not organization-scoped
    std::string scope = "organization";  // Carried metadata only
    PolicyStatus status = PolicyStatus::INACTIVE;

    std::unordered_set<std::string> data_categories;
    std::vector<RedactionRule> redaction_rules;     // Evaluated in order

    int retention_period_days = 365;    // Copied into every audit record
    bool audit_enabled = true;          // false: no audit record is written

    // Carried for policy administration; redaction does not consult these
    bool anonymization_enabled = false;
    bool consent_required = true;

    [[nodiscard]] bool is_active() const { return status == PolicyStatus::ACTIVE; }

    [[nodiscard]] bool has_category(std::string_view category) const {
        return data_categories.contains(std::string(category));
    }
};

// ============================================================================
// Redaction Result
// ============================================================================

enum class PassSource {
    RULE,
    BUILTIN
};

/// One pass (rule or built-in category) that replaced at least one match
struct PatternHit {
    PassSource source = PassSource::RULE;
    std::string pattern;
    size_t count = 0;

    PatternHit() = default;
    PatternHit(PassSource s, std::string p, size_t c)
        : source(s), pattern(std::move(p)), count(c) {}
};

struct RedactionResult {
    std::string redacted_content;
    size_t redaction_count = 0;
    std::vector<std::string> patterns_matched;  // Sorted, unique
    std::string original_hash;                  // SHA-256 hex of the untouched input
    std::vector<PatternHit> hits;
};

// ============================================================================
// Caller Context
// ============================================================================

struct CallerContext {
    std::string org_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* policy_status_to_string(PolicyStatus status) {
    switch (status) {
        case PolicyStatus::ACTIVE: return "active";
        case PolicyStatus::INACTIVE: return "inactive";
        case PolicyStatus::DRAFT: return "draft";
        case PolicyStatus::ARCHIVED: return "archived";
        default: return "inactive";
    }
}

inline const char* replacement_to_string(ReplacementStrategy strategy) {
    switch (strategy) {
        case ReplacementStrategy::MASK: return "mask";
        case ReplacementStrategy::HASH: return "hash";
        case ReplacementStrategy::REMOVE: return "remove";
        case ReplacementStrategy::TOKENIZE: return "tokenize";
        default: return "mask";
    }
}

inline const char* pass_source_to_string(PassSource source) {
    return source == PassSource::RULE ? "rule" : "builtin";
}

} // namespace redactor
