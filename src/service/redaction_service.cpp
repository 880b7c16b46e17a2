#include "service/redaction_service.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactor {

namespace {

constexpr std::string_view kNotFoundMessage = "Policy not found or inactive";

} // anonymous namespace

RedactionService::RedactionService(std::shared_ptr<const IPolicyStore> policies,
                                   std::shared_ptr<AuditEmitter> audit,
                                   RedactionEngine engine)
    : policies_(std::move(policies)),
      audit_(std::move(audit)),
      engine_(engine) {}

CallerContext RedactionService::caller_for(
    const RedactionRequest& request, const std::string& default_org_id) {
    CallerContext caller;
    caller.org_id = request.org_id.value_or(default_org_id);
    caller.agent_id = request.agent_id;
    caller.run_id = request.run_id;
    return caller;
}

Result<Policy> RedactionService::resolve_policy(
    const std::string& policy_id, const CallerContext& caller) const {

    auto policy = policies_ ? policies_->find(policy_id) : std::nullopt;
    if (!policy || !policy->is_active()) {
        return Result<Policy>::error(ErrorCategory::POLICY_NOT_FOUND, std::string(kNotFoundMessage));
    }

    // Organization-scoped policies are invisible to other organizations
    if (!policy->org_id.empty() && !caller.org_id.empty() && policy->org_id != caller.org_id) {
        return Result<Policy>::error(ErrorCategory::POLICY_NOT_FOUND, std::string(kNotFoundMessage));
    }

    return Result<Policy>::ok(std::move(*policy));
}

Result<RedactionResponse> RedactionService::redact(
    const RedactionRequest& request,
    const CallerContext& caller,
    const std::string& trace_id) const {

    if (request.content.empty() || request.policy_id.empty()) {
        return Result<RedactionResponse>::error(
            ErrorCategory::VALIDATION_ERROR, "content and policy_id are required");
    }

    auto policy = resolve_policy(request.policy_id, caller);
    if (policy.is_error()) {
        return Result<RedactionResponse>::error(policy.error_category(), policy.error_message());
    }

    auto applied = engine_.apply(request.content, policy.value());
    if (applied.is_error()) {
        const auto category = applied.error_category();
        const auto line = std::format("Redaction failed [{}] trace={}: {}",
            error_category_to_string(category), trace_id, applied.error_message());
        if (category == ErrorCategory::INTERNAL_ERROR) {
            utils::log::error(line);
        } else {
            utils::log::warn(line);
        }
        return Result<RedactionResponse>::error(category, applied.error_message());
    }

    auto& result = applied.value();

    RedactionResponse response;
    response.redaction_count = result.redaction_count;
    response.patterns_matched = result.patterns_matched;
    response.original_hash = result.original_hash;

    if (audit_ && policy.value().audit_enabled) {
        RedactionAuditRecord record;
        record.org_id = caller.org_id;
        record.policy_id = request.policy_id;
        record.agent_id = caller.agent_id;
        record.run_id = caller.run_id;
        record.trace_id = trace_id;
        record.data_type = request.data_type.empty() ? std::string(kDefaultDataType) : request.data_type;
        record.redaction_count = result.redaction_count;
        record.patterns_matched = result.patterns_matched;
        record.original_hash = result.original_hash;
        record.redacted_preview = RedactionAuditRecord::make_preview(result.redacted_content);
        record.retention_period_days = policy.value().retention_period_days;

        response.audit_recorded = audit_->emit(std::move(record));
        if (!response.audit_recorded) {
            utils::log::warn(std::format(
                "Audit write failed for policy {} trace={}; redacted content returned, "
                "reconcile original_hash {}", request.policy_id, trace_id, result.original_hash));
        }
    }

    utils::log::info(std::format("Redacted policy={} count={} patterns={} hash={}",
        request.policy_id, result.redaction_count, result.patterns_matched.size(),
        result.original_hash.substr(0, 12)));

    response.redacted_content = std::move(result.redacted_content);
    return Result<RedactionResponse>::ok(std::move(response));
}

} // namespace redactor
