#pragma once
#include <iostream>
#include <sstream>
#include <string>

// One tagged console line, written under a process-wide mutex when the
// object goes out of scope so lines from market threads never interleave.
//
//   log_info("cycle") << market << " bid=" << bid;
//   -> [cycle] BTCUSDT bid=101.5
class LogLine {
public:
    LogLine(std::ostream& os, const char* tag, const char* level);
    LogLine(LogLine&& other) noexcept;
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    ~LogLine();

    template <typename T>
    LogLine& operator<<(const T& v) {
        buf_ << v;
        return *this;
    }

private:
    std::ostream* os_;
    std::ostringstream buf_;
    bool active_ = true;
};

LogLine log_info(const char* tag);
LogLine log_warn(const char* tag);
LogLine log_error(const char* tag);
