// src/core/trust.cpp
#include "tmpltool/core/trust.h"
#include "tmpltool/core/errors.h"
#include <system_error>

namespace tmpltool {

namespace fs = std::filesystem;

WorkingRoot::WorkingRoot(const fs::path& dir) {
    std::error_code ec;
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        throw FileAccessError("Cannot resolve working directory '" + dir.string() + "': " + ec.message());
    }
    if (!fs::is_directory(canonical, ec)) {
        throw FileAccessError("Working directory is not a directory: " + canonical.string());
    }
    path_ = std::move(canonical);
}

WorkingRoot WorkingRoot::capture() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw FileAccessError("Cannot read current working directory: " + ec.message());
    }
    return WorkingRoot(cwd);
}

bool WorkingRoot::contains(const fs::path& candidate) const {
    // Compare whole components so "/work2" never passes as inside "/work"
    auto cand_it = candidate.begin();
    for (const auto& part : path_) {
        if (cand_it == candidate.end() || *cand_it != part) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

} // namespace tmpltool
