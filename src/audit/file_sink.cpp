#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace redactor {

FileSink::FileSink(const Config& config)
    : config_(config) {
    if (!open_stream()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::open_stream() {
    stream_.open(config_.output_file, std::ios::app);
    if (!stream_.is_open()) {
        return false;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);
    opened_at_ = std::chrono::system_clock::now();
    return true;
}

bool FileSink::write(std::string_view json_line) {
    if (shut_down_) {
        return false;
    }
    if (rotation_due()) {
        rotate_file();
    }
    if (!stream_.is_open()) {
        return false;
    }

    stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    stream_.flush();
    current_file_size_ += json_line.size();
    return stream_.good();
}

void FileSink::flush() {
    if (stream_.is_open()) {
        stream_.flush();
    }
}

void FileSink::shutdown() {
    shut_down_ = true;
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

bool FileSink::rotation_due() const {
    if (config_.size_based_rotation && current_file_size_ >= config_.max_file_size_bytes) {
        return true;
    }
    return config_.time_based_rotation &&
           std::chrono::system_clock::now() - opened_at_ >= config_.rotation_interval;
}

void FileSink::rotate_file() {
    namespace fs = std::filesystem;
    stream_.close();

    // Missing intermediate files are expected, so errors are only reported
    // for the rename of the live file.
    std::error_code ec;
    fs::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);
    for (int i = config_.max_files - 1; i >= 1; --i) {
        fs::rename(std::format("{}.{}", config_.output_file, i),
                   std::format("{}.{}", config_.output_file, i + 1), ec);
    }

    fs::rename(config_.output_file, config_.output_file + ".1", ec);
    if (ec) {
        utils::log::warn(std::format("Audit rotation of {} failed: {}",
                                     config_.output_file, ec.message()));
    }

    if (!open_stream()) {
        utils::log::error(std::format("Audit file {} could not be reopened after rotation",
                                      config_.output_file));
        return;
    }
    ++rotation_count_;
}

} // namespace redactor
