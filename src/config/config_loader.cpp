#include "config/config_loader.hpp"
#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace redactor {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables (unset = empty)
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input.compare(i, 2, "${") == 0) {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, val] : *tbl) {
            expand_env_vars_in_node(val);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge overlay into base. Scalars: overlay wins. Arrays: concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else if (val.is_array() && base_node && base_node->is_array()) {
            for (const auto& elem : *val.as_array()) {
                base_node->as_array()->push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Splice included files into root
 *
 * active holds the chain of files currently being resolved, so a file
 * reached twice through different branches (a diamond) is fine while a
 * file that includes one of its own ancestors is rejected.
 */
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& active, int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
    }

    std::vector<std::string> paths;
    if (const auto* single = root["include"].as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* many = root["include"].as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    if (paths.empty()) return;
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const auto abs_path = fs::canonical(base_dir / rel_path);
        if (!active.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), active, depth + 1);
        active.erase(abs_path.string());

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    namespace fs = std::filesystem;
    try {
        auto root = toml::parse_file(config_path);

        std::unordered_set<std::string> active;
        active.insert(fs::canonical(config_path).string());
        resolve_includes(root, fs::path(config_path).parent_path(), active, 0);

        expand_env_vars_in_node(root);
        return build(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}", config_path, e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error loading {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        expand_env_vars_in_node(root);
        return build(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error loading configuration: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::build(const toml::table& root) {
    RedactorConfig cfg;
    cfg.logging = extract_logging(root);
    cfg.service = extract_service(root);
    cfg.engine = extract_engine(root);
    cfg.audit = extract_audit(root);

    if (!utils::log::parse_level(cfg.logging.level)) {
        return LoadResult::error(std::format("Invalid logging level '{}'", cfg.logging.level));
    }

    auto policies = PolicyLoader::load_from_table(root);
    if (!policies.success) {
        return LoadResult::error(policies.error_message);
    }
    cfg.policies = std::move(policies.policies);

    return LoadResult::ok(std::move(cfg));
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or("info"s);
    }
    return cfg;
}

ServiceConfig ConfigLoader::extract_service(const toml::table& root) {
    ServiceConfig cfg;
    if (const auto* s = root["service"].as_table()) {
        cfg.default_org_id = (*s)["default_org_id"].value_or(""s);
    }
    return cfg;
}

EngineConfig ConfigLoader::extract_engine(const toml::table& root) {
    EngineConfig cfg;
    if (const auto* e = root["engine"].as_table()) {
        cfg.skip_builtin_after_rule = (*e)["skip_builtin_after_rule"].value_or(false);
    }
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(true);

    if (const auto* f = a["file"].as_table()) {
        cfg.output_file = (*f)["output_file"].value_or(cfg.output_file);
    }

    if (const auto* r = a["rotation"].as_table()) {
        cfg.rotation_max_file_size_mb = static_cast<size_t>((*r)["max_file_size_mb"].value_or(100));
        cfg.rotation_max_files = (*r)["max_files"].value_or(10);
        cfg.rotation_interval_hours = (*r)["interval_hours"].value_or(24);
        cfg.rotation_time_based = (*r)["time_based"].value_or(true);
        cfg.rotation_size_based = (*r)["size_based"].value_or(true);
    }

    if (const auto* sy = a["syslog"].as_table()) {
        cfg.syslog_enabled = (*sy)["enabled"].value_or(false);
        cfg.syslog_ident = (*sy)["ident"].value_or(cfg.syslog_ident);
    }

    if (const auto* ig = a["integrity"].as_table()) {
        cfg.integrity_enabled = (*ig)["enabled"].value_or(true);
    }

    return cfg;
}

} // namespace redactor
