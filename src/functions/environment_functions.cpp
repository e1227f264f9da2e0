// src/functions/environment_functions.cpp
#include "tmpltool/functions/builtins.h"
#include "tmpltool/core/errors.h"
#include <cstdlib>

namespace tmpltool {

void register_environment_functions(FunctionRegistry& registry) {
    registry.register_function(
        FunctionMetadata{"get_env", "environment", "Get an environment variable with an optional default",
                         {ArgumentMetadata{"name", "string", true, std::nullopt, "Environment variable name"},
                          ArgumentMetadata{"default", "string", false, std::nullopt,
                                           "Value returned when the variable is unset"}},
                         "string",
                         {"{{ get_env(\"HOME\") }}", "{{ get_env(\"PORT\", \"8080\") }}"}},
        [](const Kwargs& kwargs) -> Value {
            std::string name = get_string_arg(kwargs, "get_env", "name");
            if (const char* value = std::getenv(name.c_str())) {
                return std::string(value);
            }
            auto it = kwargs.find("default");
            if (it != kwargs.end()) {
                return it->second;
            }
            throw ArgumentError("Environment variable '" + name + "' is not set and no default provided");
        });
}

} // namespace tmpltool
