// common/utils/diagnostics.cpp
#include "common/utils/diagnostics.h"
#include <atomic>
#include <iostream>

namespace tmpltool {

static std::atomic<bool> g_verbose{false};

void set_verbose(bool enabled) {
    g_verbose.store(enabled);
}

bool verbose() {
    return g_verbose.load();
}

void log_warning(const std::string& message) {
    std::cerr << "[WARNING] " << message << std::endl;
}

void log_debug(const std::string& message) {
    if (!verbose()) return;
    std::cerr << "[DEBUG] " << message << std::endl;
}

} // namespace tmpltool
