#pragma once

#include "config/config_types.hpp"
#include <toml++/toml.hpp>
#include <string>

namespace redactor {

/**
 * @brief Loads redactor.toml
 *
 * Supports ${ENV_VAR} expansion in every string value and
 * include = "other.toml" / include = ["a.toml", "b.toml"] (relative to the
 * including file, main file wins on conflicts, arrays concatenate).
 *
 * Sections: [logging] [service] [engine] [audit] [[policies]]
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

private:
    static LoadResult build(const toml::table& root);

    static LoggingConfig extract_logging(const toml::table& root);
    static ServiceConfig extract_service(const toml::table& root);
    static EngineConfig extract_engine(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
};

} // namespace redactor
