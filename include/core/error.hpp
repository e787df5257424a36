// error.hpp: engine error kinds and the single exception type carrying them
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace core {

enum class ErrorKind : int {
    InvalidArgument        = 1,
    UnresolvedLocationRole = 2,
    NoFeasibleAlternative  = 3,
    UnsupportedMethod      = 4,
    InfeasibleSelection    = 5,
    NoApplicablePersona    = 6,
};

inline const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::InvalidArgument:        return "InvalidArgument";
        case ErrorKind::UnresolvedLocationRole: return "UnresolvedLocationRole";
        case ErrorKind::NoFeasibleAlternative:  return "NoFeasibleAlternative";
        case ErrorKind::UnsupportedMethod:      return "UnsupportedMethod";
        case ErrorKind::InfeasibleSelection:    return "InfeasibleSelection";
        case ErrorKind::NoApplicablePersona:    return "NoApplicablePersona";
    }
    return "Unknown";
}

/**
 * @brief Exception raised by every engine operation.
 * @details what() reads "<Kind>: <message>"; message() is the bare text, which
 *          names the offending role, destination, method or bounds.
 */
class Error final : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind), message_(std::move(message)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorKind   kind_;
    std::string message_;
};

[[noreturn]] inline void fail(ErrorKind kind, std::string message) {
    throw Error(kind, std::move(message));
}

} // namespace core

#define DM_ENSURE(EXPR, KIND, MSG) do { if (!(EXPR)) ::core::fail((KIND), (MSG)); } while(0)
