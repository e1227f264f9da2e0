#ifndef TMPLTOOL_CORE_TRUST_H
#define TMPLTOOL_CORE_TRUST_H

#include <filesystem>

namespace tmpltool {

// Decided once from --trust before rendering starts, then only ever copied.
class TrustContext {
public:
    TrustContext() = default;
    explicit TrustContext(bool trusted) : trusted_(trusted) {}

    bool trusted() const { return trusted_; }

private:
    bool trusted_ = false;
};

// Canonical directory every relative template path is anchored to.
class WorkingRoot {
public:
    // Canonicalizes `dir`; throws FileAccessError if it cannot be resolved
    explicit WorkingRoot(const std::filesystem::path& dir);

    // Snapshot of the process working directory
    static WorkingRoot capture();

    const std::filesystem::path& path() const { return path_; }

    // Component-wise subtree test on an absolute, already normalized path
    bool contains(const std::filesystem::path& candidate) const;

private:
    std::filesystem::path path_;
};

} // namespace tmpltool

#endif // TMPLTOOL_CORE_TRUST_H
