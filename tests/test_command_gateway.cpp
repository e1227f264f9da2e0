// tests/test_command_gateway.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tmpltool/exec/command_gateway.h"
#include "tmpltool/core/errors.h"
#include "test_helpers.h"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <string>
#include <sys/types.h>
#include <unistd.h>

using namespace tmpltool;
using tmpltool::testing::TempDir;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

ExecutionRequest request(const std::string& command, unsigned timeout = 10) {
    ExecutionRequest r;
    r.command = command;
    r.timeout_seconds = timeout;
    return r;
}

} // namespace

TEST_CASE("Untrusted gateway refuses before spawning", "[exec][trust]") {
    TempDir dir;
    auto marker = dir.path() / "marker";
    CommandGateway gateway(TrustContext(false));

    try {
        gateway.run_checked(request("touch '" + marker.string() + "'"));
        FAIL("expected CapabilityDenied");
    } catch (const CapabilityDenied& e) {
        REQUIRE(std::string(e.what()) ==
                "Security: exec() function requires trust mode. Use --trust flag to enable command execution.");
    }
    REQUIRE_THROWS_WITH(gateway.run(request("touch '" + marker.string() + "'")),
                        StartsWith("Security: exec_raw() function requires trust mode."));
    REQUIRE_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("echo hello in both conventions", "[exec]") {
    CommandGateway gateway(TrustContext(true));

    REQUIRE(gateway.run_checked(request("echo hello")) == "hello\n");

    ExecutionResult r = gateway.run(request("echo hello"));
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.stdout_text == "hello\n");
    REQUIRE(r.stderr_text.empty());
    REQUIRE(r.success);
    REQUIRE_FALSE(r.truncated());
}

TEST_CASE("Non-zero exit differs between conventions", "[exec]") {
    CommandGateway gateway(TrustContext(true));

    ExecutionResult r = gateway.run(request("exit 1"));
    REQUIRE(r.exit_code == 1);
    REQUIRE_FALSE(r.success);

    try {
        gateway.run_checked(request("echo boom >&2; exit 1"));
        FAIL("expected NonZeroExit");
    } catch (const NonZeroExit& e) {
        REQUIRE(e.exit_code() == 1);
        REQUIRE(e.stderr_output() == "boom\n");
        REQUIRE(std::string(e.what()) == "Command failed (exit 1): echo boom >&2; exit 1\nStderr: boom\n");
    }
}

TEST_CASE("stderr is captured separately", "[exec]") {
    CommandGateway gateway(TrustContext(true));
    ExecutionResult r = gateway.run(request("echo out; echo err >&2; exit 3"));
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.stdout_text == "out\n");
    REQUIRE(r.stderr_text == "err\n");
}

TEST_CASE("Timeout kills the command and leaves nothing behind", "[exec][timeout]") {
    TempDir dir;
    auto pid_file = dir.path() / "pid";
    CommandGateway gateway(TrustContext(true));

    auto start = std::chrono::steady_clock::now();
    try {
        gateway.run(request("echo $$ > '" + pid_file.string() + "'; sleep 30", 1));
        FAIL("expected CommandTimeout");
    } catch (const CommandTimeout& e) {
        REQUIRE(e.timeout_seconds() == 1);
        REQUIRE_THAT(e.what(), StartsWith("Command timed out after 1 seconds: "));
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(10));

    std::ifstream in(pid_file);
    pid_t pid = 0;
    in >> pid;
    REQUIRE(pid > 0);
    REQUIRE(::kill(pid, 0) == -1);
    REQUIRE(errno == ESRCH);
    REQUIRE(active_command_count() == 0);
}

namespace {

// Gone, or a zombie waiting for init to reap it
bool process_gone(pid_t pid) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(pid, 0) == -1 && errno == ESRCH) {
            return true;
        }
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (std::getline(stat, line)) {
            auto close = line.rfind(')');
            if (close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z') {
                return true;
            }
        }
        ::usleep(50 * 1000);
    }
    return false;
}

} // namespace

TEST_CASE("Timeout also kills background children of the command", "[exec][timeout]") {
    TempDir dir;
    auto pid_file = dir.path() / "bg";
    CommandGateway gateway(TrustContext(true));

    REQUIRE_THROWS_AS(gateway.run(request("sleep 30 & echo $! > '" + pid_file.string() + "'; wait", 1)),
                      CommandTimeout);

    std::ifstream in(pid_file);
    pid_t pid = 0;
    in >> pid;
    REQUIRE(pid > 0);
    REQUIRE(process_gone(pid));
    REQUIRE(active_command_count() == 0);
}

TEST_CASE("Output beyond the cap is truncated", "[exec][limits]") {
    CommandGateway gateway(TrustContext(true), GatewayLimits{16, kDefaultMaxConcurrentCommands});

    ExecutionResult r = gateway.run(request("yes | head -n 100"));
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.stdout_text.size() == 16);
    REQUIRE(r.stdout_truncated);
    REQUIRE_FALSE(r.stderr_truncated);
    REQUIRE(r.truncated());
}

TEST_CASE("Signal deaths map to 128 + signal", "[exec]") {
    CommandGateway gateway(TrustContext(true));
    ExecutionResult r = gateway.run(request("kill -9 $$"));
    REQUIRE(r.exit_code == 128 + SIGKILL);
    REQUIRE_FALSE(r.success);
}

TEST_CASE("Invalid UTF-8 output is decoded lossily", "[exec]") {
    CommandGateway gateway(TrustContext(true));
    ExecutionResult r = gateway.run(request("printf '\\377abc'"));
    REQUIRE(r.stdout_text == "\xEF\xBF\xBD" "abc");
}

TEST_CASE("Commands see no stdin", "[exec]") {
    CommandGateway gateway(TrustContext(true));
    ExecutionResult r = gateway.run(request("wc -c"));
    REQUIRE(r.exit_code == 0);
    REQUIRE_THAT(r.stdout_text, StartsWith("0"));
}

TEST_CASE("Timeout bounds", "[exec][timeout]") {
    REQUIRE(clamp_timeout(5) == 5);
    REQUIRE(clamp_timeout(300) == 300);
    REQUIRE(clamp_timeout(1000) == kMaxExecTimeoutSec);
    REQUIRE_THROWS_AS(clamp_timeout(0), ArgumentError);
    REQUIRE_THROWS_AS(clamp_timeout(-3), ArgumentError);

    CommandGateway gateway(TrustContext(true));
    REQUIRE_THROWS_AS(gateway.run(request("true", 0)), ArgumentError);
    REQUIRE_THROWS_AS(gateway.run(request("true", 301)), ArgumentError);
}
