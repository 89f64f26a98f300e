#include "log.hpp"

#include <mutex>

// ---- Logging (avoid interleaved prints from multiple threads) ----
static std::mutex g_log_mtx;

LogLine::LogLine(std::ostream& os, const char* tag, const char* level)
    : os_(&os)
{
    buf_ << "[" << tag << "] ";
    if (level) buf_ << level << ": ";
}

LogLine::LogLine(LogLine&& other) noexcept
    : os_(other.os_), buf_(std::move(other.buf_)), active_(other.active_)
{
    other.active_ = false;
}

LogLine::~LogLine() {
    if (!active_) return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    *os_ << buf_.str() << "\n";
    os_->flush();
}

LogLine log_info(const char* tag)  { return LogLine(std::cout, tag, nullptr); }
LogLine log_warn(const char* tag)  { return LogLine(std::cerr, tag, "WARN"); }
LogLine log_error(const char* tag) { return LogLine(std::cerr, tag, "ERROR"); }
