// src/functions/builtins.cpp
#include "tmpltool/functions/builtins.h"

namespace tmpltool {

void register_all_functions(FunctionRegistry& registry, const PathSandbox& sandbox,
                            const CommandGateway& gateway, unsigned default_timeout) {
    register_filesystem_functions(registry, sandbox);
    register_data_file_functions(registry, sandbox);
    register_exec_functions(registry, gateway, default_timeout);
    register_environment_functions(registry);
}

} // namespace tmpltool
