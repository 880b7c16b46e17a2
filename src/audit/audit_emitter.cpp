#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "audit/syslog_sink.hpp"
#include "core/hashing.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactor {

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditEmitter::AuditEmitter(const AuditConfig& config)
    : integrity_enabled_(config.integrity_enabled) {

    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
    file_cfg.max_files = config.rotation_max_files;
    file_cfg.rotation_interval = std::chrono::hours(config.rotation_interval_hours);
    file_cfg.time_based_rotation = config.rotation_time_based;
    file_cfg.size_based_rotation = config.rotation_size_based;
    sinks_.push_back(std::make_unique<FileSink>(file_cfg));

    if (config.syslog_enabled) {
        SyslogSink::Config sl_cfg;
        sl_cfg.ident = config.syslog_ident;
        sinks_.push_back(std::make_unique<SyslogSink>(sl_cfg));
    }
}

AuditEmitter::AuditEmitter(std::vector<std::unique_ptr<IAuditSink>> sinks,
                           bool integrity_enabled)
    : sinks_(std::move(sinks)),
      integrity_enabled_(integrity_enabled) {}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

bool AuditEmitter::emit(RedactionAuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || sinks_.empty()) {
        return false;
    }

    record.sequence_num = sequence_counter_++;
    if (integrity_enabled_) {
        record.previous_hash = previous_hash_;
        record.record_hash = compute_record_hash(record, previous_hash_);
        previous_hash_ = record.record_hash;
    }

    std::string line = to_json(record);
    line += '\n';

    bool all_ok = true;
    for (auto& sink : sinks_) {
        if (!sink->write(line)) {
            all_ok = false;
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Audit sink {} rejected record {}",
                                         sink->name(), record.audit_id));
        }
    }

    total_emitted_.fetch_add(1, std::memory_order_relaxed);
    return all_ok;
}

void AuditEmitter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditEmitter::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;

    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

AuditEmitter::Stats AuditEmitter::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = running_ ? sinks_.size() : 0
    };
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void append_string(std::string& out, std::string_view key, std::string_view value) {
    out += std::format("\"{}\":\"{}\",", key, utils::escape_json(value));
}

void append_optional(std::string& out, std::string_view key,
                     const std::optional<std::string>& value) {
    if (value) {
        append_string(out, key, *value);
    } else {
        out += std::format("\"{}\":null,", key);
    }
}

void append_string_array(std::string& out, std::string_view key,
                         const std::vector<std::string>& items) {
    out += std::format("\"{}\":[", key);
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(items[i]));
    }
    out += "],";
}

std::string join(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

std::string AuditEmitter::to_json(const RedactionAuditRecord& r) {
    std::string out;
    out.reserve(512 + r.redacted_preview.size());
    out += '{';

    append_string(out, "audit_id", r.audit_id);
    out += std::format("\"sequence_num\":{},", r.sequence_num);
    append_string(out, "timestamp", utils::format_timestamp(r.timestamp));

    append_string(out, "org_id", r.org_id);
    append_string(out, "policy_id", r.policy_id);
    append_optional(out, "agent_id", r.agent_id);
    append_optional(out, "run_id", r.run_id);
    if (!r.trace_id.empty()) {
        append_string(out, "trace_id", r.trace_id);
    }

    append_string(out, "data_type", r.data_type);
    out += std::format("\"redaction_count\":{},", r.redaction_count);
    append_string_array(out, "patterns_matched", r.patterns_matched);
    append_string(out, "original_hash", r.original_hash);
    append_string(out, "redacted_preview", r.redacted_preview);
    out += std::format("\"retention_period_days\":{},", r.retention_period_days);

    if (!r.record_hash.empty()) {
        append_string(out, "record_hash", r.record_hash);
        append_string(out, "previous_hash", r.previous_hash);
    }

    out.back() = '}';
    return out;
}

// ============================================================================
// Hash Chain
// ============================================================================

std::string AuditEmitter::compute_record_hash(
    const RedactionAuditRecord& record, const std::string& prev_hash) {

    // sequence|timestamp|org|policy|agent|run|data_type|count|patterns|original_hash|preview|retention|previous
    std::string input;
    input.reserve(256 + record.redacted_preview.size());
    input += std::format("{}", record.sequence_num);
    input += '|';
    input += utils::format_timestamp(record.timestamp);
    input += '|';
    input += record.org_id;
    input += '|';
    input += record.policy_id;
    input += '|';
    input += record.agent_id.value_or("");
    input += '|';
    input += record.run_id.value_or("");
    input += '|';
    input += record.data_type;
    input += '|';
    input += std::format("{}", record.redaction_count);
    input += '|';
    input += join(record.patterns_matched, ',');
    input += '|';
    input += record.original_hash;
    input += '|';
    input += record.redacted_preview;
    input += '|';
    input += std::format("{}", record.retention_period_days);
    input += '|';
    input += prev_hash;

    return hashing::sha256_hex(input);
}

int64_t AuditEmitter::verify_chain(const std::vector<RedactionAuditRecord>& records) {
    std::string expected_prev = records.empty() ? std::string() : records.front().previous_hash;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        if (record.previous_hash != expected_prev ||
            record.record_hash != compute_record_hash(record, record.previous_hash)) {
            return static_cast<int64_t>(i);
        }
        expected_prev = record.record_hash;
    }
    return -1;
}

} // namespace redactor
