#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace redactor {

static constexpr std::string_view kPolicies       = "policies";
static constexpr std::string_view kRedactionRules = "redaction_rules";
static constexpr std::string_view kDataCategories = "data_categories";

// ============================================================================
// Public API - Load from file
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open policy file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

// ============================================================================
// Public API - Load from string
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto root = toml::parse(toml_content);
        return load_from_table(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

// ============================================================================
// Public API - Load from parsed table
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_table(const toml::table& root) {
    std::vector<Policy> policies;

    const auto* policies_array = root[kPolicies].as_array();
    if (!policies_array) {
        return LoadResult::ok(std::move(policies));
    }

    std::unordered_set<std::string> seen_ids;

    for (const auto& elem : *policies_array) {
        const auto* node = elem.as_table();
        if (!node) {
            return LoadResult::error("Each [[policies]] entry must be a table");
        }
        const auto& tbl = *node;

        Policy policy;

        // Required: id
        policy.id = tbl["id"].value_or(""s);
        if (policy.id.empty()) {
            return LoadResult::error("Policy must have an id");
        }
        if (!seen_ids.insert(policy.id).second) {
            return LoadResult::error(std::format("Duplicate policy id '{}'", policy.id));
        }

        // Required: status
        const std::string status_str = tbl["status"].value_or("inactive"s);
        const auto status = parse_status(status_str);
        if (!status) {
            return LoadResult::error(
                std::format("Policy '{}': Invalid status '{}'", policy.id, status_str));
        }
        policy.status = *status;

        // Optional metadata
        policy.name = tbl["name"].value_or(policy.id);
        policy.description = tbl["description"].value_or(""s);
        policy.org_id = tbl["org_id"].value_or(""s);
        policy.scope = tbl["scope"].value_or("organization"s);
        policy.retention_period_days = tbl["retention_period_days"].value_or(365);
        policy.audit_enabled = tbl["audit_enabled"].value_or(true);
        policy.anonymization_enabled = tbl["anonymization_enabled"].value_or(false);
        policy.consent_required = tbl["consent_required"].value_or(true);

        // Optional: data_categories array
        if (const auto* cats = tbl[kDataCategories].as_array()) {
            for (const auto& cat : *cats) {
                if (const auto* s = cat.as_string(); s && !s->get().empty()) {
                    policy.data_categories.insert(utils::to_lower(s->get()));
                }
            }
        }

        // Optional: redaction_rules array (order preserved)
        if (const auto* rules = tbl[kRedactionRules].as_array()) {
            for (size_t i = 0; i < rules->size(); ++i) {
                const auto* rule_tbl = (*rules)[i].as_table();
                if (!rule_tbl) {
                    return LoadResult::error(
                        std::format("Policy '{}': rule {} must be a table", policy.id, i));
                }

                RedactionRule rule;
                rule.pattern_type = utils::to_lower((*rule_tbl)["pattern_type"].value_or(""s));
                rule.regex = (*rule_tbl)["regex"].value_or(""s);

                const std::string replacement_str = (*rule_tbl)["replacement"].value_or("mask"s);
                const auto replacement = parse_replacement(replacement_str);
                if (!replacement) {
                    return LoadResult::error(
                        std::format("Policy '{}': rule {}: Invalid replacement '{}'",
                                    policy.id, i, replacement_str));
                }
                rule.replacement = *replacement;

                policy.redaction_rules.emplace_back(std::move(rule));
            }
        }

        std::string error_msg;
        if (!validate_policy(policy, error_msg)) {
            return LoadResult::error(std::format("Policy '{}': {}", policy.id, error_msg));
        }

        policies.emplace_back(std::move(policy));
    }

    return LoadResult::ok(std::move(policies));
}

// ============================================================================
// Parsing Helpers
// ============================================================================

std::optional<PolicyStatus> PolicyLoader::parse_status(const std::string& status_str) {
    const std::string lower = utils::to_lower(status_str);

    static const std::unordered_map<std::string, PolicyStatus> lookup = {
        {"active",   PolicyStatus::ACTIVE},
        {"inactive", PolicyStatus::INACTIVE},
        {"draft",    PolicyStatus::DRAFT},
        {"archived", PolicyStatus::ARCHIVED},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<ReplacementStrategy> PolicyLoader::parse_replacement(const std::string& replacement_str) {
    const std::string lower = utils::to_lower(replacement_str);

    static const std::unordered_map<std::string, ReplacementStrategy> lookup = {
        {"mask",     ReplacementStrategy::MASK},
        {"hash",     ReplacementStrategy::HASH},
        {"remove",   ReplacementStrategy::REMOVE},
        {"tokenize", ReplacementStrategy::TOKENIZE},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

bool PolicyLoader::validate_policy(const Policy& policy, std::string& error_msg) {
    if (policy.retention_period_days < 0) {
        error_msg = "retention_period_days must be non-negative";
        return false;
    }

    for (size_t i = 0; i < policy.redaction_rules.size(); ++i) {
        if (policy.redaction_rules[i].pattern_type.empty()) {
            error_msg = std::format("rule {} must have a pattern_type", i);
            return false;
        }
    }

    return true;
}

} // namespace redactor
