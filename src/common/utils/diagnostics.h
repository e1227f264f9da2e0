#ifndef TMPLTOOL_COMMON_UTILS_DIAGNOSTICS_H
#define TMPLTOOL_COMMON_UTILS_DIAGNOSTICS_H

#include <string>

namespace tmpltool {

// Diagnostics share stderr with nothing but themselves; stdout is reserved
// for rendered output.
void set_verbose(bool enabled);
bool verbose();

void log_warning(const std::string& message);
void log_debug(const std::string& message); // no-op unless verbose

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_UTILS_DIAGNOSTICS_H
