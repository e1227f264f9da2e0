// src/functions/exec_functions.cpp
#include "tmpltool/functions/builtins.h"

namespace tmpltool {

namespace {

ExecutionRequest make_request(const std::string& function, const Kwargs& kwargs, unsigned default_timeout) {
    ExecutionRequest request;
    request.command = get_string_arg(kwargs, function, "command");
    auto timeout = get_optional_int_arg(kwargs, function, "timeout");
    request.timeout_seconds = timeout ? clamp_timeout(*timeout) : default_timeout;
    return request;
}

std::vector<ArgumentMetadata> exec_arguments(unsigned default_timeout) {
    return {
        ArgumentMetadata{"command", "string", true, std::nullopt, "Shell command to execute"},
        ArgumentMetadata{"timeout", "integer", false, std::to_string(default_timeout),
                         "Timeout in seconds (max " + std::to_string(kMaxExecTimeoutSec) + ")"},
    };
}

} // namespace

Value execution_result_to_json(const ExecutionResult& result) {
    Value out = Value::object();
    out["exit_code"] = result.exit_code;
    out["stdout"] = result.stdout_text;
    out["stderr"] = result.stderr_text;
    out["success"] = result.success;
    out["truncated"] = result.truncated();
    return out;
}

void register_exec_functions(FunctionRegistry& registry, const CommandGateway& gateway, unsigned default_timeout) {
    registry.register_function(
        FunctionMetadata{"exec", "exec",
                         "Execute a shell command and return stdout; fails on non-zero exit (requires --trust)",
                         exec_arguments(default_timeout), "string",
                         {"{{ exec(\"git rev-parse --short HEAD\") }}",
                          "{{ exec(\"make version\", 60) }}"}},
        [gateway, default_timeout](const Kwargs& kwargs) -> Value {
            return gateway.run_checked(make_request("exec", kwargs, default_timeout));
        },
        [gateway] { gateway.require_trust("exec()"); });

    registry.register_function(
        FunctionMetadata{"exec_raw", "exec",
                         "Execute a shell command and return exit_code, stdout, stderr and success (requires --trust)",
                         exec_arguments(default_timeout), "object",
                         {"{% set r = exec_raw(\"test -f build.lock\") %}{% if r.success %}locked{% endif %}"}},
        [gateway, default_timeout](const Kwargs& kwargs) -> Value {
            return execution_result_to_json(gateway.run(make_request("exec_raw", kwargs, default_timeout)));
        },
        [gateway] { gateway.require_trust("exec_raw()"); });
}

} // namespace tmpltool
