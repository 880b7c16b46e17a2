#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

namespace redactor {

// ============================================================================
// Redaction Audit Record
// ============================================================================

/**
 * Append-only proof that a redaction happened. Never carries the original
 * content: only its SHA-256 and a bounded preview of the redacted output.
 */
struct RedactionAuditRecord {
    static constexpr size_t kPreviewChars = 200;

    std::string audit_id;
    uint64_t sequence_num = 0;          // Monotonic, assigned by AuditEmitter
    std::chrono::system_clock::time_point timestamp;

    // Attribution
    std::string org_id;
    std::string policy_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    std::string trace_id;

    // Redaction outcome
    std::string data_type{kDefaultDataType};
    size_t redaction_count = 0;
    std::vector<std::string> patterns_matched;
    std::string original_hash;
    std::string redacted_preview;       // First kPreviewChars code points of redacted content
    int retention_period_days = 365;    // From the policy; drives downstream purging

    // Integrity (hash chain)
    std::string record_hash;
    std::string previous_hash;

    RedactionAuditRecord()
        : audit_id(utils::generate_uuid()),
          timestamp(utils::now()) {}

    /// Bounded preview of already-redacted content
    static std::string make_preview(std::string_view redacted_content) {
        return utils::utf8_prefix(redacted_content, kPreviewChars);
    }
};

} // namespace redactor
