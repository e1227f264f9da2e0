#ifndef TMPLTOOL_CLI_APP_H
#define TMPLTOOL_CLI_APP_H

#include "tmpltool/functions/registry.h"
#include "tmpltool/core/config.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace tmpltool {

// Whole program: options, config, registry, render, output. Returns the
// process exit code; every failure is reported as "Error: <message>" on `err`.
int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

int run_cli(int argc, char* argv[]);

// Metadata catalog behind --ide
Value export_function_metadata(const FunctionRegistry& registry);
std::string format_function_metadata(const FunctionRegistry& registry, IdeFormat format);

} // namespace tmpltool

#endif // TMPLTOOL_CLI_APP_H
