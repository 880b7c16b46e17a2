#include "audit/audit_emitter.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "policy/policy_store.hpp"
#include "redaction/redaction_engine.hpp"
#include "service/redaction_service.hpp"
#include "service/request_codec.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace redactor;

// Global for signal handling
std::shared_ptr<AuditEmitter> g_audit;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_audit) {
        g_audit->shutdown();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/redactor.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("Loading configuration from {}", config_file));

        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const auto& config = loaded.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto store = std::make_shared<InMemoryPolicyStore>(config.policies);
        utils::log::info(std::format("Loaded {} privacy policies", store->size()));

        if (config.audit.enabled) {
            g_audit = std::make_shared<AuditEmitter>(config.audit);
            utils::log::info(std::format("Audit log: {} (integrity {})",
                config.audit.output_file, config.audit.integrity_enabled ? "on" : "off"));
        } else {
            utils::log::warn("Audit disabled: redactions will not be recorded");
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        RedactionEngine::Options engine_options;
        engine_options.skip_builtin_after_rule = config.engine.skip_builtin_after_rule;
        const RedactionService service(store, g_audit, RedactionEngine(engine_options));

        // One JSON request per line on stdin, one JSON response per line on stdout
        std::string line;
        while (std::getline(std::cin, line)) {
            if (utils::trim(line).empty()) continue;

            const std::string trace_id = utils::generate_trace_id();

            auto request = codec::decode_request(line);
            if (request.is_error()) {
                std::cout << codec::encode_error(request.error_category(),
                                                 request.error_message(), trace_id) << '\n';
                std::cout.flush();
                continue;
            }

            const auto caller = RedactionService::caller_for(
                request.value(), config.service.default_org_id);
            auto response = service.redact(request.value(), caller, trace_id);

            if (response.is_ok()) {
                std::cout << codec::encode_response(response.value()) << '\n';
            } else {
                std::cout << codec::encode_error(response.error_category(),
                                                 response.error_message(), trace_id) << '\n';
            }
            std::cout.flush();
        }

        if (g_audit) {
            g_audit->shutdown();
        }
        utils::log::info("Input closed, exiting");
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
