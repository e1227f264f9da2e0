// tests/test_path_sandbox.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tmpltool/sandbox/path_sandbox.h"
#include "tmpltool/core/errors.h"
#include "test_helpers.h"

using namespace tmpltool;
using tmpltool::testing::TempDir;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace fs = std::filesystem;

TEST_CASE("Relative path inside the root resolves under it", "[sandbox]") {
    TempDir dir;
    dir.write("templates/config.txt", "x");
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));

    SandboxedPath p = sandbox.validate("templates/config.txt");
    REQUIRE(p.path() == dir.path() / "templates" / "config.txt");
    REQUIRE(p.raw() == "templates/config.txt");
}

TEST_CASE("Absolute paths are rejected without trust", "[sandbox]") {
    TempDir dir;
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));

    try {
        sandbox.validate("/etc/passwd");
        FAIL("expected SecurityViolation");
    } catch (const SecurityViolation& e) {
        REQUIRE(e.kind() == ErrorKind::SECURITY);
        REQUIRE(std::string(to_string(e.kind())) == "security");
        REQUIRE_THAT(e.what(), StartsWith("Security: Absolute paths"));
        REQUIRE_THAT(e.what(), ContainsSubstring("Use --trust to bypass this restriction."));
    }
}

TEST_CASE("Parent traversal is rejected even when it stays inside", "[sandbox]") {
    TempDir dir;
    dir.write("a/b.txt", "x");
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));

    REQUIRE_THROWS_AS(sandbox.validate("../etc/passwd"), SecurityViolation);
    REQUIRE_THROWS_AS(sandbox.validate("a/../a/b.txt"), SecurityViolation);
    REQUIRE_THROWS_AS(sandbox.validate(".."), SecurityViolation);
}

TEST_CASE("Dots inside a file name are not traversal", "[sandbox]") {
    REQUIRE_FALSE(has_parent_component("file..txt"));
    REQUIRE_FALSE(has_parent_component("a/..b/c"));
    REQUIRE(has_parent_component("a/../b"));
    REQUIRE(has_parent_component(".."));

    TempDir dir;
    dir.write("file..txt", "x");
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));
    REQUIRE_NOTHROW(sandbox.validate("file..txt"));
}

TEST_CASE("NUL bytes are rejected", "[sandbox]") {
    TempDir dir;
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));
    std::string raw("ok.txt\0/etc/passwd", 18);
    REQUIRE_THROWS_AS(sandbox.validate(raw), SecurityViolation);
}

TEST_CASE("Missing in-bounds paths validate", "[sandbox]") {
    TempDir dir;
    PathSandbox sandbox(WorkingRoot(dir.path()), TrustContext(false));

    SandboxedPath p = sandbox.validate("does/not/exist.txt");
    REQUIRE(p.path() == dir.path() / "does" / "not" / "exist.txt");
    REQUIRE(sandbox.validate("").path() == dir.path());
}

TEST_CASE("Symlink pointing outside the root is an escape", "[sandbox][symlink]") {
    TempDir root;
    TempDir outside;
    outside.write("secret.txt", "top secret");
    fs::create_symlink(outside.path() / "secret.txt", root.path() / "link.txt");
    fs::create_directory_symlink(outside.path(), root.path() / "outdir");

    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(false));

    REQUIRE_THROWS_WITH(sandbox.validate("link.txt"), ContainsSubstring("outside the working directory"));
    REQUIRE_THROWS_AS(sandbox.validate("outdir/secret.txt"), SecurityViolation);
    // missing file below an escaping directory link
    REQUIRE_THROWS_AS(sandbox.validate("outdir/missing.txt"), SecurityViolation);
}

TEST_CASE("Dangling symlink is checked through its target", "[sandbox][symlink]") {
    TempDir root;
    TempDir outside;
    fs::create_symlink(outside.path() / "not_yet.txt", root.path() / "dangling_out");
    fs::create_symlink(root.path() / "not_yet.txt", root.path() / "dangling_in");

    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(false));
    REQUIRE_THROWS_AS(sandbox.validate("dangling_out"), SecurityViolation);
    REQUIRE_NOTHROW(sandbox.validate("dangling_in"));
}

TEST_CASE("Symlink staying inside the root is allowed", "[sandbox][symlink]") {
    TempDir root;
    root.write("real/data.txt", "x");
    fs::create_directory_symlink(root.path() / "real", root.path() / "alias");

    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(false));
    REQUIRE(sandbox.validate("alias/data.txt").path() == root.path() / "alias" / "data.txt");
}

TEST_CASE("Trusted mode resolves paths as given", "[sandbox][trust]") {
    TempDir root;
    TempDir outside;
    fs::create_symlink(outside.path(), root.path() / "out");
    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(true));

    REQUIRE(sandbox.validate("/etc/hostname").path() == fs::path("/etc/hostname"));
    REQUIRE(sandbox.validate("../x").path() == root.path() / ".." / "x");
    REQUIRE_NOTHROW(sandbox.validate("out/anything"));
}

TEST_CASE("Free-function validate_path matches the sandbox", "[sandbox]") {
    TempDir root;
    WorkingRoot wr(root.path());
    REQUIRE_THROWS_AS(validate_path("/tmp", wr, TrustContext(false)), SecurityViolation);
    REQUIRE(validate_path("/tmp", wr, TrustContext(true)).path() == fs::path("/tmp"));
}

TEST_CASE("WorkingRoot containment compares whole components", "[sandbox][root]") {
    TempDir root;
    WorkingRoot wr(root.path());
    REQUIRE(wr.contains(root.path()));
    REQUIRE(wr.contains(root.path() / "a" / "b"));
    REQUIRE_FALSE(wr.contains(fs::path(root.path().string() + "2") / "a"));
    REQUIRE_FALSE(wr.contains(root.path().parent_path()));

    REQUIRE_THROWS_AS(WorkingRoot(root.path() / "missing"), FileAccessError);
}

TEST_CASE("Glob patterns follow the lexical rules", "[sandbox][glob]") {
    TempDir root;
    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(false));

    REQUIRE(sandbox.resolve_glob("*.txt") == (root.path() / "*.txt").string());
    REQUIRE_THROWS_AS(sandbox.resolve_glob("/etc/*"), SecurityViolation);
    REQUIRE_THROWS_AS(sandbox.resolve_glob("../*"), SecurityViolation);
}

TEST_CASE("Glob directory prefix must stay inside the root", "[sandbox][glob][symlink]") {
    TempDir root;
    TempDir outside;
    root.mkdir("src/include");
    fs::create_symlink(outside.path(), root.path() / "link");
    PathSandbox sandbox(WorkingRoot(root.path()), TrustContext(false));

    REQUIRE(sandbox.resolve_glob("src/include/*.h") == (root.path() / "src/include/*.h").string());
    REQUIRE(sandbox.resolve_glob("missing/*.h") == (root.path() / "missing/*.h").string());
    REQUIRE_THROWS_WITH(sandbox.resolve_glob("link/*.h"), StartsWith("Security: Path resolves outside"));
    REQUIRE_THROWS_AS(sandbox.resolve_glob("link/sub/**/*.h"), SecurityViolation);
    REQUIRE(!sandbox.contains_resolved(root.path() / "link"));
    REQUIRE(sandbox.contains_resolved(root.path() / "src"));
}
