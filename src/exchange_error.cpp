#include "exchange_error.hpp"

const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::Transient:      return "Transient";
        case ErrorKind::Fatal:          return "Fatal";
        case ErrorKind::AmbiguousWrite: return "AmbiguousWrite";
    }
    return "Unknown";
}

ErrorKind ErrorClassifier::classify(int status, const std::string& message, bool timed_out) const {
    if (timed_out) return ErrorKind::Transient;

    if (non_fatal_codes_.count(status) > 0) return ErrorKind::Transient;

    for (const auto& needle : non_fatal_messages_) {
        if (!needle.empty() && message.find(needle) != std::string::npos)
            return ErrorKind::Transient;
    }
    return ErrorKind::Fatal;
}

ExchangeError ErrorClassifier::make_error(int status, const std::string& message, bool timed_out) const {
    return ExchangeError(classify(status, message, timed_out), message, status);
}
