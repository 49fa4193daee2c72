#pragma once
// Logging: debug lines on stderr, audit trail on disk
//
// Hooks must stay quiet on stdout (it is the injection channel), so all
// diagnostics go to stderr. The audit log is append-only, one timestamped
// line per injection or feedback event.

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace ace {

// Global verbose flag for debug logging
inline std::atomic<bool>& verbose_mode() {
    static std::atomic<bool> flag{false};
    return flag;
}

namespace detail {

inline void vlog(const char* component, const char* fmt, va_list args) {
    auto now_tp = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now_tp);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now_tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] ";
    std::cerr.flush();
    vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

}  // namespace detail

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode()) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog(component, fmt, args);
    va_end(args);
}

// Append-only audit trail. Each record is a single write() on an O_APPEND
// descriptor so lines from concurrent hooks never interleave.
class AuditLog {
public:
    explicit AuditLog(std::string path) : path_(std::move(path)) {}

    bool append(const std::string& event, const std::string& fields) const {
        std::string line = format_iso8601(now()) + " " + event;
        if (!fields.empty()) line += " " + fields;
        for (char& c : line) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        line += '\n';

        int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd < 0) {
            log_debug("audit", "cannot open %s", path_.c_str());
            return false;
        }
        ssize_t written = ::write(fd, line.data(), line.size());
        ::close(fd);
        return written == static_cast<ssize_t>(line.size());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace ace
