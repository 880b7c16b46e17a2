#pragma once

#include <string>
#include <string_view>

namespace redactor {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Each sink receives serialized JSON lines from AuditEmitter, which
 * serializes all calls under its own mutex, so implementations need no
 * internal locking.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Append one JSON-serialized audit record. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/redactor/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace redactor
