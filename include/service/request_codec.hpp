#pragma once

#include "core/error.hpp"
#include "service/redaction_service.hpp"
#include <string>
#include <string_view>

namespace redactor::codec {

/**
 * @brief Decode one JSON request object
 *
 * Unknown keys are ignored, missing keys keep their defaults and null is
 * accepted for agent_id / run_id / org_id. Malformed JSON or a value of
 * the wrong type is a VALIDATION_ERROR. Presence of content / policy_id
 * is checked by RedactionService, not here.
 */
[[nodiscard]] Result<RedactionRequest> decode_request(std::string_view json);

/// {"success":true,"redacted_content":...,"original_hash":...,"audit_recorded":...}
[[nodiscard]] std::string encode_response(const RedactionResponse& response);

/// {"success":false,"error":...,"code":...,"retryable":...,"trace_id":...}
[[nodiscard]] std::string encode_error(ErrorCategory category,
                                       std::string_view message,
                                       std::string_view trace_id);

} // namespace redactor::codec
