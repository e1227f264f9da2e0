#ifndef TMPLTOOL_FUNCTIONS_BUILTINS_H
#define TMPLTOOL_FUNCTIONS_BUILTINS_H

#include "tmpltool/exec/command_gateway.h"
#include "tmpltool/functions/registry.h"
#include "tmpltool/sandbox/path_sandbox.h"

namespace tmpltool {

// Each registration captures its own copy of the sandbox/gateway, so the
// trust decision travels with the closure rather than living in globals.

// read_file, file_exists, is_file, is_dir, is_symlink, list_dir, glob,
// file_size, file_modified, read_lines
void register_filesystem_functions(FunctionRegistry& registry, const PathSandbox& sandbox);

// read_json_file, read_yaml_file
void register_data_file_functions(FunctionRegistry& registry, const PathSandbox& sandbox);

// exec, exec_raw
void register_exec_functions(FunctionRegistry& registry, const CommandGateway& gateway,
                             unsigned default_timeout = kDefaultExecTimeoutSec);

// get_env
void register_environment_functions(FunctionRegistry& registry);

void register_all_functions(FunctionRegistry& registry, const PathSandbox& sandbox,
                            const CommandGateway& gateway,
                            unsigned default_timeout = kDefaultExecTimeoutSec);

// {exit_code, stdout, stderr, success, truncated}
Value execution_result_to_json(const ExecutionResult& result);

} // namespace tmpltool

#endif // TMPLTOOL_FUNCTIONS_BUILTINS_H
