#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace redactor {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Service Config
// ============================================================================

struct ServiceConfig {
    std::string default_org_id;     // Caller organization when a request names none
};

// ============================================================================
// Engine Config
// ============================================================================

struct EngineConfig {
    bool skip_builtin_after_rule = false;
};

// ============================================================================
// Audit Config
// ============================================================================

struct AuditConfig {
    bool enabled = true;
    std::string output_file = "redaction_audit.jsonl";

    // File rotation
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;
    int rotation_interval_hours = 24;
    bool rotation_time_based = true;
    bool rotation_size_based = true;

    // Syslog sink
    bool syslog_enabled = false;
    std::string syslog_ident = "redactor";

    // Hash chain
    bool integrity_enabled = true;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct RedactorConfig {
    LoggingConfig logging;
    ServiceConfig service;
    EngineConfig engine;
    AuditConfig audit;
    std::vector<Policy> policies;
};

} // namespace redactor
