#pragma once

#include <stdexcept>
#include <string>

namespace capsule {

// Failure taxonomy surfaced through ExecutionOutcome.
enum class ErrorKind {
    NONE,
    VALIDATION,  // rejected before execution
    RESOURCE,    // limits/isolation could not be applied
    TIMEOUT,     // deadline elapsed
    RUNTIME,     // snippet faulted during permitted execution
    CHANNEL,     // isolated child output unparsable
};

// "ValidationError", "Timeout", ...
const char* error_kind_name(ErrorKind k);

// Inverse of error_kind_name. Unknown names map to RUNTIME.
ErrorKind error_kind_from_name(const std::string& s);

// Formats "<Kind>: <message>".
std::string format_error(ErrorKind k, const std::string& message);

class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised by the lexer/parser. Always reported as a validation failure.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(int line, int col, const std::string& message)
        : std::runtime_error("syntax error at " + std::to_string(line) + ":" + std::to_string(col) + ": " + message),
          line_(line), col_(col) {}
    int line() const { return line_; }
    int col() const { return col_; }

private:
    int line_;
    int col_;
};

} // namespace capsule
