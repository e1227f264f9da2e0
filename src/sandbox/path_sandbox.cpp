// src/sandbox/path_sandbox.cpp
#include "tmpltool/sandbox/path_sandbox.h"
#include "tmpltool/core/errors.h"
#include <system_error>

namespace tmpltool {

namespace fs = std::filesystem;

namespace {

// Same bound the kernel uses for symlink chains
constexpr int kMaxSymlinkHops = 40;

const char* const kTrustHint = ". Use --trust to bypass this restriction.";

[[noreturn]] void throw_escape(std::string_view raw_path) {
    throw SecurityViolation("Security: Path resolves outside the working directory: " +
                            std::string(raw_path) + kTrustHint);
}

[[noreturn]] void throw_unverifiable(std::string_view raw_path, const std::error_code& ec) {
    throw SecurityViolation("Security: Cannot verify that path stays inside the working directory: " +
                            std::string(raw_path) + " (" + ec.message() + ")" + kTrustHint);
}

} // namespace

bool has_parent_component(std::string_view raw_path) {
    size_t start = 0;
    while (start <= raw_path.size()) {
        size_t end = raw_path.find('/', start);
        if (end == std::string_view::npos) end = raw_path.size();
        if (raw_path.substr(start, end - start) == "..") {
            return true;
        }
        start = end + 1;
    }
    return false;
}

void PathSandbox::check_lexical(std::string_view raw_path) const {
    if (raw_path.find('\0') != std::string_view::npos) {
        // c_str() would silently cut the path at the NUL
        throw SecurityViolation("Security: Path contains a NUL byte" + std::string(kTrustHint));
    }
    if ((!raw_path.empty() && raw_path.front() == '/') || fs::path(std::string(raw_path)).is_absolute()) {
        throw SecurityViolation("Security: Absolute paths are not allowed: " + std::string(raw_path) + kTrustHint);
    }
    if (has_parent_component(raw_path)) {
        throw SecurityViolation("Security: Parent directory (..) traversal is not allowed: " +
                                std::string(raw_path) + kTrustHint);
    }
}

fs::path PathSandbox::join(std::string_view raw_path) const {
    fs::path p{std::string(raw_path)};
    if (p.is_absolute()) {
        return p;
    }
    if (p.empty()) {
        return root_.path();
    }
    if (trust_.trusted()) {
        // resolved exactly as given; "link/.." must keep its OS meaning
        return root_.path() / p;
    }
    return (root_.path() / p).lexically_normal();
}

void PathSandbox::check_containment(std::string_view raw_path, const fs::path& candidate) const {
    std::error_code ec;
    fs::path resolved = fs::canonical(candidate, ec);
    if (!ec) {
        if (!root_.contains(resolved)) {
            throw_escape(raw_path);
        }
        return;
    }

    // Target missing (file about to be checked or created): canonicalize the
    // existing ancestors and keep the missing tail lexical.
    fs::path weak = fs::weakly_canonical(candidate, ec);
    if (ec) {
        throw_inaccessible(raw_path, candidate, ec);
    }
    if (!root_.contains(weak)) {
        throw_escape(raw_path);
    }

    // A dangling symlink leaf would be followed by a later create/open
    fs::path link = candidate;
    for (int hop = 0; hop < kMaxSymlinkHops; ++hop) {
        fs::file_status st = fs::symlink_status(link, ec);
        if (ec || !fs::is_symlink(st)) {
            return;
        }
        fs::path target = fs::read_symlink(link, ec);
        if (ec) {
            throw_unverifiable(raw_path, ec);
        }
        if (target.is_relative()) {
            target = link.parent_path() / target;
        }
        link = fs::weakly_canonical(target, ec);
        if (ec) {
            throw_unverifiable(raw_path, ec);
        }
        if (!root_.contains(link)) {
            throw_escape(raw_path);
        }
    }
    throw_unverifiable(raw_path, std::make_error_code(std::errc::too_many_symbolic_link_levels));
}

void PathSandbox::throw_inaccessible(std::string_view raw_path, const fs::path& candidate,
                                     const std::error_code& cause) const {
    // The deepest ancestor that still resolves decides who owns the failure:
    // inside the root it is an ordinary I/O error (EACCES on a locked dir).
    std::error_code ec;
    for (fs::path dir = candidate.parent_path(); !dir.empty(); dir = dir.parent_path()) {
        fs::path resolved = fs::canonical(dir, ec);
        if (!ec) {
            if (!root_.contains(resolved)) {
                throw_escape(raw_path);
            }
            throw FileAccessError("Failed to access '" + std::string(raw_path) + "': " + cause.message());
        }
        if (dir == dir.root_path()) break;
    }
    throw_unverifiable(raw_path, cause);
}

SandboxedPath PathSandbox::validate(std::string_view raw_path) const {
    if (trust_.trusted()) {
        return SandboxedPath(std::string(raw_path), join(raw_path));
    }
    check_lexical(raw_path);
    fs::path candidate = join(raw_path);
    check_containment(raw_path, candidate);
    return SandboxedPath(std::string(raw_path), std::move(candidate));
}

std::string PathSandbox::resolve_glob(std::string_view raw_pattern) const {
    if (trust_.trusted()) {
        return join(raw_pattern).string();
    }
    check_lexical(raw_pattern);

    // Directories named literally before the first wildcard are entered
    // as-is by the walker, so they get the same check as a plain path.
    std::string prefix;
    size_t start = 0;
    while (start < raw_pattern.size()) {
        size_t end = raw_pattern.find('/', start);
        if (end == std::string_view::npos) break; // leaf component
        std::string_view comp = raw_pattern.substr(start, end - start);
        if (comp.find_first_of("*?[") != std::string_view::npos) break;
        prefix = std::string(raw_pattern.substr(0, end));
        start = end + 1;
    }
    if (!prefix.empty()) {
        check_containment(raw_pattern, join(prefix));
    }
    return join(raw_pattern).string();
}

bool PathSandbox::contains_resolved(const fs::path& path) const {
    if (trust_.trusted()) {
        return true;
    }
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        resolved = fs::weakly_canonical(path, ec);
        if (ec) {
            return false;
        }
    }
    return root_.contains(resolved);
}

SandboxedPath validate_path(std::string_view raw_path, const WorkingRoot& root, const TrustContext& trust) {
    return PathSandbox(root, trust).validate(raw_path);
}

} // namespace tmpltool
