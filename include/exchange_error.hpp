#pragma once
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class ErrorKind {
    Transient,       // timeout / allow-listed code or message; reads may be retried
    Fatal,           // auth, malformed request, insufficient funds, anything unclassified
    AmbiguousWrite   // a write failed and we could not tell whether it took effect
};

const char* error_kind_str(ErrorKind k);

class ExchangeError : public std::runtime_error {
public:
    ExchangeError(ErrorKind kind, const std::string& what, int status = 0)
        : std::runtime_error(what), kind_(kind), status_(status) {}

    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }
    bool transient() const { return kind_ == ErrorKind::Transient; }

private:
    ErrorKind kind_;
    int status_;
};

// Decides Transient vs Fatal from what the transport reported.
// Pure: depends only on its inputs and the allow-lists given at construction.
class ErrorClassifier {
public:
    ErrorClassifier() = default;
    ErrorClassifier(std::set<int> non_fatal_codes,
                    std::vector<std::string> non_fatal_messages)
        : non_fatal_codes_(std::move(non_fatal_codes)),
          non_fatal_messages_(std::move(non_fatal_messages)) {}

    ErrorKind classify(int status, const std::string& message, bool timed_out = false) const;

    // Convenience: classify and wrap.
    ExchangeError make_error(int status, const std::string& message, bool timed_out = false) const;

    const std::set<int>& non_fatal_codes() const { return non_fatal_codes_; }
    const std::vector<std::string>& non_fatal_messages() const { return non_fatal_messages_; }

private:
    std::set<int> non_fatal_codes_;
    std::vector<std::string> non_fatal_messages_;
};
