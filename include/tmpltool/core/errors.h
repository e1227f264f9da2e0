#ifndef TMPLTOOL_CORE_ERRORS_H
#define TMPLTOOL_CORE_ERRORS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tmpltool {

enum class ErrorKind : uint8_t {
    SECURITY,
    CAPABILITY_DENIED,
    TIMEOUT,
    SPAWN,
    IO,
    NON_ZERO_EXIT,
    INVALID_ARGUMENT,
    RENDER
};

const char* to_string(ErrorKind kind);

// Base of every failure a helper or the renderer reports. None of them is
// retried; they abort the render and reach the user verbatim.
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Absolute path, traversal token or symlink escape outside trust mode
class SecurityViolation : public ToolError {
public:
    explicit SecurityViolation(const std::string& message)
        : ToolError(ErrorKind::SECURITY, message) {}
};

// exec/exec_raw without --trust
class CapabilityDenied : public ToolError {
public:
    explicit CapabilityDenied(const std::string& message)
        : ToolError(ErrorKind::CAPABILITY_DENIED, message) {}
};

class CommandTimeout : public ToolError {
public:
    CommandTimeout(const std::string& message, unsigned timeout_seconds)
        : ToolError(ErrorKind::TIMEOUT, message), timeout_seconds_(timeout_seconds) {}

    unsigned timeout_seconds() const { return timeout_seconds_; }

private:
    unsigned timeout_seconds_;
};

class SpawnError : public ToolError {
public:
    explicit SpawnError(const std::string& message)
        : ToolError(ErrorKind::SPAWN, message) {}
};

// Missing file, permission denied, undecodable content...
class FileAccessError : public ToolError {
public:
    explicit FileAccessError(const std::string& message)
        : ToolError(ErrorKind::IO, message) {}
};

class NonZeroExit : public ToolError {
public:
    NonZeroExit(const std::string& message, int exit_code, std::string stderr_output)
        : ToolError(ErrorKind::NON_ZERO_EXIT, message),
          exit_code_(exit_code),
          stderr_output_(std::move(stderr_output)) {}

    int exit_code() const { return exit_code_; }
    const std::string& stderr_output() const { return stderr_output_; }

private:
    int exit_code_;
    std::string stderr_output_;
};

class ArgumentError : public ToolError {
public:
    explicit ArgumentError(const std::string& message)
        : ToolError(ErrorKind::INVALID_ARGUMENT, message) {}
};

struct SourceLocation {
    size_t line = 0;
    size_t column = 0;
};

// Failure of a whole render, carrying the call site when one is known
class RenderError : public ToolError {
public:
    RenderError(const std::string& message,
                std::optional<SourceLocation> location = std::nullopt,
                ErrorKind cause = ErrorKind::RENDER)
        : ToolError(ErrorKind::RENDER, message), location_(location), cause_(cause) {}

    const std::optional<SourceLocation>& location() const { return location_; }
    // Kind of the helper failure that aborted the render (RENDER for engine errors)
    ErrorKind cause() const { return cause_; }

private:
    std::optional<SourceLocation> location_;
    ErrorKind cause_;
};

} // namespace tmpltool

#endif // TMPLTOOL_CORE_ERRORS_H
