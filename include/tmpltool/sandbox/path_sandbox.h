#ifndef TMPLTOOL_SANDBOX_PATH_SANDBOX_H
#define TMPLTOOL_SANDBOX_PATH_SANDBOX_H

#include "tmpltool/core/trust.h"
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tmpltool {

// Result of a successful validation. Only ever handed straight to the
// filesystem call that asked for it.
class SandboxedPath {
public:
    SandboxedPath(std::string raw, std::filesystem::path resolved)
        : raw_(std::move(raw)), path_(std::move(resolved)) {}

    // Absolute path to use for I/O. Lexically normal in untrusted mode;
    // trusted mode keeps ".." so the OS resolves it.
    const std::filesystem::path& path() const { return path_; }
    // The string the template passed in, for error messages
    const std::string& raw() const { return raw_; }

private:
    std::string raw_;
    std::filesystem::path path_;
};

// Gate every filesystem helper goes through before touching disk.
//
// Untrusted mode rejects, in order: absolute paths, any ".." component
// (even if the result would stay inside the root), and candidates whose
// canonical form leaves the working root (symlink escapes). A candidate
// that does not exist yet is checked through its existing ancestors, so
// checking a missing in-bounds file is fine. A candidate that cannot be
// resolved because an in-bounds directory denies access is FileAccessError.
//
// Trusted mode resolves paths as given, joining relative ones to the root.
class PathSandbox {
public:
    PathSandbox(WorkingRoot root, TrustContext trust)
        : root_(std::move(root)), trust_(trust) {}

    // Throws SecurityViolation, or FileAccessError as above. Performs no I/O
    // besides the containment check.
    SandboxedPath validate(std::string_view raw_path) const;

    // Same lexical rules for a glob pattern, plus the containment check on
    // the literal directory prefix ("link/" in "link/*.h"). Returns the
    // absolute pattern.
    std::string resolve_glob(std::string_view raw_pattern) const;

    // Post-check for paths discovered by walking the tree: glob results and
    // every directory the walker is about to list. Always true in trusted mode.
    bool contains_resolved(const std::filesystem::path& path) const;

    const WorkingRoot& root() const { return root_; }
    const TrustContext& trust() const { return trust_; }

private:
    void check_lexical(std::string_view raw_path) const;
    std::filesystem::path join(std::string_view raw_path) const;
    void check_containment(std::string_view raw_path, const std::filesystem::path& candidate) const;
    [[noreturn]] void throw_inaccessible(std::string_view raw_path, const std::filesystem::path& candidate,
                                         const std::error_code& cause) const;

    WorkingRoot root_;
    TrustContext trust_;
};

// Free-function form: validate(raw_path, working_root, trust)
SandboxedPath validate_path(std::string_view raw_path, const WorkingRoot& root, const TrustContext& trust);

// True if any '/'-separated component of `raw_path` equals ".."
bool has_parent_component(std::string_view raw_path);

} // namespace tmpltool

#endif // TMPLTOOL_SANDBOX_PATH_SANDBOX_H
