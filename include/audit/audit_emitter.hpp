#pragma once

#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "config/config_types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace redactor {

/**
 * @brief Synchronous, hash-chained audit emitter
 *
 * emit() assigns a monotonic sequence number, links the record to its
 * predecessor (record_hash = SHA-256 over the record's fields and the
 * previous record_hash), serializes it to one JSON line and hands it to
 * every sink before returning. The return value tells the caller whether
 * every sink accepted the record, so an audit failure is never silent.
 *
 * Calls are serialized by an internal mutex: the chain order equals the
 * sequence order.
 */
class AuditEmitter {
public:
    /**
     * @brief Build sinks from AuditConfig: FileSink (with rotation), plus
     *        SyslogSink when enabled. Throws if the audit file cannot be opened.
     */
    explicit AuditEmitter(const AuditConfig& config);

    /// Emitter over caller-provided sinks (tests, embedding)
    explicit AuditEmitter(std::vector<std::unique_ptr<IAuditSink>> sinks,
                          bool integrity_enabled = true);

    ~AuditEmitter();

    AuditEmitter(const AuditEmitter&) = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;

    /**
     * @brief Append a record to every sink
     * @return true if all sinks accepted the record
     */
    [[nodiscard]] bool emit(RedactionAuditRecord record);

    void flush();

    /// Flush and close all sinks; later emit() calls return false
    void shutdown();

    struct Stats {
        uint64_t total_emitted;         ///< Records handed to sinks
        uint64_t sink_write_failures;   ///< Individual sink write failures
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static std::string to_json(const RedactionAuditRecord& record);

    [[nodiscard]] static std::string compute_record_hash(
        const RedactionAuditRecord& record, const std::string& prev_hash);

    /**
     * @brief Re-derive the chain for records in sequence order
     *
     * The first record's previous_hash is taken as the anchor, so a window
     * cut from the middle of a log verifies as well as a full log.
     * @return Index of the first record whose link or hash does not verify,
     *         or -1 if the whole chain is intact
     */
    [[nodiscard]] static int64_t verify_chain(const std::vector<RedactionAuditRecord>& records);

private:
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<IAuditSink>> sinks_;
    bool integrity_enabled_ = true;
    bool running_ = true;
    uint64_t sequence_counter_ = 0;
    std::string previous_hash_;

    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace redactor
