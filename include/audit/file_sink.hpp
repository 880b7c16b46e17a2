#pragma once

#include "audit/audit_sink.hpp"
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace redactor {

/**
 * @brief Append-only JSONL audit file with size and time-based rotation
 *
 * Rotated files get numeric suffixes (audit.jsonl.1 is the newest);
 * files beyond max_files are deleted. Each write() is flushed so a crash
 * loses at most the record being written.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "redaction_audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    /// Throws std::runtime_error if the file cannot be opened for append
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }
    [[nodiscard]] bool is_shut_down() const { return shut_down_; }

private:
    [[nodiscard]] bool rotation_due() const;
    void rotate_file();
    bool open_stream();

    Config config_;
    std::ofstream stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    bool shut_down_ = false;            // Terminal: rotation never reopens a shut-down sink
    std::chrono::system_clock::time_point opened_at_;
};

} // namespace redactor
