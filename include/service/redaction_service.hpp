#pragma once

#include "audit/audit_emitter.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "policy/policy_store.hpp"
#include "redaction/redaction_engine.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace redactor {

struct RedactionRequest {
    std::string content;
    std::string policy_id;
    std::string data_type{kDefaultDataType};
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    std::optional<std::string> org_id;     // Overrides the configured caller organization
};

struct RedactionResponse {
    std::string redacted_content;
    size_t redaction_count = 0;
    std::vector<std::string> patterns_matched;
    std::string original_hash;
    bool audit_recorded = false;           // false: reconcile out-of-band
};

/**
 * @brief Request-level orchestration around RedactionEngine
 *
 * validate -> resolve policy -> apply -> audit. The audit write happens
 * only after a successful apply. A failed audit write does not withhold
 * the redacted content; it is reported through audit_recorded and a WARN
 * log line carrying the trace id.
 */
class RedactionService {
public:
    /// audit may be null when auditing is disabled by configuration
    RedactionService(std::shared_ptr<const IPolicyStore> policies,
                     std::shared_ptr<AuditEmitter> audit,
                     RedactionEngine engine = RedactionEngine{});

    [[nodiscard]] Result<RedactionResponse> redact(
        const RedactionRequest& request,
        const CallerContext& caller,
        const std::string& trace_id) const;

    /// Caller context for a request: request org_id wins over default_org_id
    [[nodiscard]] static CallerContext caller_for(
        const RedactionRequest& request, const std::string& default_org_id);

private:
    [[nodiscard]] Result<Policy> resolve_policy(
        const std::string& policy_id, const CallerContext& caller) const;

    std::shared_ptr<const IPolicyStore> policies_;
    std::shared_ptr<AuditEmitter> audit_;
    RedactionEngine engine_;
};

} // namespace redactor
