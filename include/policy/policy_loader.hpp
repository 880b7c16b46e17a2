#pragma once

#include "core/types.hpp"
#include <toml++/toml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace redactor {

/**
 * @brief Privacy policy loader from TOML configuration
 *
 * Reads the [[policies]] array with nested [[policies.redaction_rules]].
 * Validates:
 * - Non-empty, unique policy ids
 * - Status values (active/inactive/draft/archived)
 * - Replacement values (mask/hash/remove/tokenize)
 * - Non-empty pattern types
 *
 * custom_regex expressions are not compiled here; a malformed expression
 * surfaces as CONFIG_ERROR when the policy is applied.
 */
class PolicyLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success;
        std::string error_message;
        std::vector<Policy> policies;

        static LoadResult ok(std::vector<Policy> policies_vec) {
            LoadResult result;
            result.success = true;
            result.policies = std::move(policies_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load policies from a TOML file
     */
    static LoadResult load_from_file(const std::string& path);

    /**
     * @brief Load policies from TOML text
     */
    static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Extract policies from an already parsed document.
     * A document without [[policies]] yields an empty, successful result.
     */
    static LoadResult load_from_table(const toml::table& root);

    static std::optional<PolicyStatus> parse_status(const std::string& status_str);
    static std::optional<ReplacementStrategy> parse_replacement(const std::string& replacement_str);

private:
    static bool validate_policy(const Policy& policy, std::string& error_msg);
};

} // namespace redactor
