#ifndef TMPLTOOL_EXEC_COMMAND_GATEWAY_H
#define TMPLTOOL_EXEC_COMMAND_GATEWAY_H

#include "tmpltool/core/trust.h"
#include <cstddef>
#include <string>

namespace tmpltool {

constexpr unsigned kDefaultExecTimeoutSec = 30;
constexpr unsigned kMaxExecTimeoutSec = 300;
constexpr size_t kDefaultMaxOutputBytes = 1024 * 1024;
constexpr size_t kDefaultMaxConcurrentCommands = 16;

struct ExecutionRequest {
    std::string command;
    unsigned timeout_seconds = kDefaultExecTimeoutSec; // (0, 300]
};

struct ExecutionResult {
    int exit_code = -1;       // 128 + signal when the child was killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool success = false;     // exit_code == 0
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool truncated() const { return stdout_truncated || stderr_truncated; }
};

struct GatewayLimits {
    size_t max_output_bytes = kDefaultMaxOutputBytes; // per stream
    size_t max_concurrent = kDefaultMaxConcurrentCommands;
};

// Runs one `sh -c` command per call with a hard wall-clock deadline.
//
// The child leads its own process group; on timeout the whole group gets
// SIGKILL and is reaped before CommandTimeout is thrown. Nothing is retried.
// Both calling conventions fail with CapabilityDenied before spawning
// anything unless trust mode is on.
class CommandGateway {
public:
    explicit CommandGateway(TrustContext trust, GatewayLimits limits = GatewayLimits{});

    // "Raw" convention: full result whatever the exit status.
    // Throws CapabilityDenied, CommandTimeout or SpawnError.
    ExecutionResult run(const ExecutionRequest& request) const;

    // "Throw on failure" convention: stdout, or NonZeroExit carrying stderr.
    std::string run_checked(const ExecutionRequest& request) const;

    const GatewayLimits& limits() const { return limits_; }

    // CapabilityDenied unless trust mode is on. `function_name` is the
    // template-facing name, e.g. "exec()".
    void require_trust(const char* function_name) const;

private:
    ExecutionResult spawn_and_wait(const ExecutionRequest& request) const;

    TrustContext trust_;
    GatewayLimits limits_;
};

// Clamps a template-supplied timeout into (0, 300]; throws ArgumentError for <= 0
unsigned clamp_timeout(long long requested_seconds);

// Number of children currently tracked for signal forwarding
size_t active_command_count();

} // namespace tmpltool

#endif // TMPLTOOL_EXEC_COMMAND_GATEWAY_H
