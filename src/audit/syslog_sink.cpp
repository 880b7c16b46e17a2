#include "audit/syslog_sink.hpp"
#include <syslog.h>

namespace redactor {

SyslogSink::SyslogSink(const Config& config)
    : config_(config) {
    // openlog keeps the ident pointer, config_ outlives the connection
    openlog(config_.ident.c_str(), LOG_NDELAY | LOG_PID, config_.facility);
    open_ = true;
}

SyslogSink::~SyslogSink() {
    shutdown();
}

bool SyslogSink::write(std::string_view json_line) {
    if (!open_) return false;

    if (!json_line.empty() && json_line.back() == '\n') {
        json_line.remove_suffix(1);
    }
    syslog(config_.priority, "%.*s", static_cast<int>(json_line.size()), json_line.data());
    ++records_written_;
    return true;
}

void SyslogSink::shutdown() {
    if (open_) {
        closelog();
        open_ = false;
    }
}

std::string SyslogSink::name() const {
    return "syslog:" + config_.ident;
}

} // namespace redactor
