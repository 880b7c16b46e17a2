#include "service/request_codec.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <format>

namespace redactor::codec {

Result<RedactionRequest> decode_request(std::string_view json) {
    // glaze expects a null-terminated buffer
    const std::string buffer(json);

    RedactionRequest request;
    const auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, buffer);
    if (ec) {
        return Result<RedactionRequest>::error(
            ErrorCategory::VALIDATION_ERROR,
            std::format("Malformed request: {}", glz::format_error(ec, buffer)));
    }
    return Result<RedactionRequest>::ok(std::move(request));
}

std::string encode_response(const RedactionResponse& response) {
    std::string out;
    out.reserve(256 + response.redacted_content.size());

    out += std::format("{{\"success\":true,\"redacted_content\":\"{}\",\"redaction_count\":{},",
                       utils::escape_json(response.redacted_content), response.redaction_count);

    out += "\"patterns_matched\":[";
    for (size_t i = 0; i < response.patterns_matched.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(response.patterns_matched[i]));
    }
    out += "],";

    out += std::format("\"original_hash\":\"{}\",\"audit_recorded\":{}}}",
                       response.original_hash, utils::booltostr(response.audit_recorded));
    return out;
}

std::string encode_error(ErrorCategory category,
                         std::string_view message,
                         std::string_view trace_id) {
    return std::format(
        "{{\"success\":false,\"error\":\"{}\",\"code\":\"{}\",\"retryable\":{},\"trace_id\":\"{}\"}}",
        utils::escape_json(message), error_category_to_string(category),
        utils::booltostr(is_retryable(category)), utils::escape_json(trace_id));
}

} // namespace redactor::codec
