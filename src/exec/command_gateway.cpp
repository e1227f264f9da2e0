// src/exec/command_gateway.cpp
#include "tmpltool/exec/command_gateway.h"
#include "tmpltool/core/errors.h"
#include "common/utils/diagnostics.h"
#include "common/utils/text.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tmpltool {

namespace {

using Clock = std::chrono::steady_clock;

// ---------------------------------------------------------------------------
// Live children: process groups that must die with us on SIGINT/SIGTERM.
// The handler only touches lock-free atomics.
// ---------------------------------------------------------------------------

constexpr size_t kLiveSlotCapacity = 256;
constexpr pid_t kSlotFree = 0;
constexpr pid_t kSlotReserved = -1;

std::array<std::atomic<pid_t>, kLiveSlotCapacity> g_live_groups{};

struct sigaction g_prev_sigint;
struct sigaction g_prev_sigterm;
std::once_flag g_forwarder_once;

void forward_signal_to_children(int sig) {
    for (auto& slot : g_live_groups) {
        pid_t pgid = slot.load();
        if (pgid > 0) {
            ::killpg(pgid, SIGKILL);
        }
    }
    // restore what was there before us and deliver again
    ::sigaction(sig, sig == SIGINT ? &g_prev_sigint : &g_prev_sigterm, nullptr);
    ::raise(sig);
}

void install_signal_forwarder() {
    std::call_once(g_forwarder_once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = forward_signal_to_children;
        sigemptyset(&sa.sa_mask);

        // An embedder that already handles these signals keeps them
        if (::sigaction(SIGINT, nullptr, &g_prev_sigint) == 0 && g_prev_sigint.sa_handler == SIG_DFL) {
            ::sigaction(SIGINT, &sa, nullptr);
        }
        if (::sigaction(SIGTERM, nullptr, &g_prev_sigterm) == 0 && g_prev_sigterm.sa_handler == SIG_DFL) {
            ::sigaction(SIGTERM, &sa, nullptr);
        }
    });
}

class LiveChildSlot {
public:
    explicit LiveChildSlot(size_t limit) {
        size_t n = std::min(limit, kLiveSlotCapacity);
        for (size_t i = 0; i < n; ++i) {
            pid_t expected = kSlotFree;
            if (g_live_groups[i].compare_exchange_strong(expected, kSlotReserved)) {
                slot_ = &g_live_groups[i];
                return;
            }
        }
        throw SpawnError("Too many concurrent commands (limit " + std::to_string(n) + ")");
    }

    ~LiveChildSlot() { slot_->store(kSlotFree); }

    LiveChildSlot(const LiveChildSlot&) = delete;
    LiveChildSlot& operator=(const LiveChildSlot&) = delete;

    void track(pid_t pgid) { slot_->store(pgid); }

private:
    std::atomic<pid_t>* slot_ = nullptr;
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    Pipe p;
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
    return p;
}

// One captured stream: keeps at most `cap` bytes, drains the rest
struct StreamCapture {
    UniqueFd fd;
    std::string data;
    size_t cap = 0;
    bool truncated = false;

    // false once EOF has been seen
    bool drain() {
        char buf[65536];
        while (true) {
            ssize_t n = ::read(fd.get(), buf, sizeof(buf));
            if (n > 0) {
                size_t room = cap > data.size() ? cap - data.size() : 0;
                size_t take = std::min(room, static_cast<size_t>(n));
                data.append(buf, take);
                if (take < static_cast<size_t>(n)) truncated = true;
                continue;
            }
            if (n == 0) {
                fd.reset();
                return false;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            fd.reset();
            return false;
        }
    }
};

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void reap(pid_t pid, int* status) {
    while (::waitpid(pid, status, 0) < 0 && errno == EINTR) {
    }
}

[[noreturn]] void kill_group_and_timeout(pid_t pid, const ExecutionRequest& request) {
    ::killpg(pid, SIGKILL);
    int status = 0;
    reap(pid, &status);
    throw CommandTimeout("Command timed out after " + std::to_string(request.timeout_seconds) +
                         " seconds: " + request.command, request.timeout_seconds);
}

} // namespace

unsigned clamp_timeout(long long requested_seconds) {
    if (requested_seconds <= 0) {
        throw ArgumentError("Timeout must be a positive number of seconds, got " +
                            std::to_string(requested_seconds));
    }
    if (requested_seconds > static_cast<long long>(kMaxExecTimeoutSec)) {
        log_warning("Timeout " + std::to_string(requested_seconds) + "s exceeds the " +
                    std::to_string(kMaxExecTimeoutSec) + "s maximum; clamping");
        return kMaxExecTimeoutSec;
    }
    return static_cast<unsigned>(requested_seconds);
}

size_t active_command_count() {
    size_t n = 0;
    for (const auto& slot : g_live_groups) {
        if (slot.load() != kSlotFree) ++n;
    }
    return n;
}

CommandGateway::CommandGateway(TrustContext trust, GatewayLimits limits)
    : trust_(trust), limits_(limits) {
    if (limits_.max_concurrent == 0) limits_.max_concurrent = 1;
}

void CommandGateway::require_trust(const char* function_name) const {
    if (!trust_.trusted()) {
        throw CapabilityDenied(std::string("Security: ") + function_name +
                               " function requires trust mode. Use --trust flag to enable command execution.");
    }
}

ExecutionResult CommandGateway::run(const ExecutionRequest& request) const {
    require_trust("exec_raw()");
    return spawn_and_wait(request);
}

std::string CommandGateway::run_checked(const ExecutionRequest& request) const {
    require_trust("exec()");
    ExecutionResult result = spawn_and_wait(request);
    if (result.exit_code != 0) {
        throw NonZeroExit("Command failed (exit " + std::to_string(result.exit_code) + "): " +
                          request.command + "\nStderr: " + result.stderr_text,
                          result.exit_code, result.stderr_text);
    }
    if (result.stdout_truncated) {
        log_warning("Output of command '" + request.command + "' truncated to " +
                    std::to_string(limits_.max_output_bytes) + " bytes");
    }
    return result.stdout_text;
}

ExecutionResult CommandGateway::spawn_and_wait(const ExecutionRequest& request) const {
    if (request.timeout_seconds == 0 || request.timeout_seconds > kMaxExecTimeoutSec) {
        throw ArgumentError("Timeout must be in (0, " + std::to_string(kMaxExecTimeoutSec) +
                            "] seconds, got " + std::to_string(request.timeout_seconds));
    }

    install_signal_forwarder();
    LiveChildSlot slot(limits_.max_concurrent);

    Pipe out = make_pipe();
    Pipe err = make_pipe();
    Pipe exec_status = make_pipe();
    UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        throw SpawnError(std::string("Failed to open /dev/null: ") + std::strerror(errno));
    }

    // everything the child touches is prepared before fork
    const char* command = request.command.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnError("Failed to execute command '" + request.command + "': " + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(out.write_end.get(), STDOUT_FILENO);
        ::dup2(err.write_end.get(), STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", command, static_cast<char*>(nullptr));
        int e = errno;
        ssize_t ignored = ::write(exec_status.write_end.get(), &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    // mirror the child's setpgid so killpg works even if we win the race
    ::setpgid(pid, pid);
    slot.track(pid);
    auto deadline = Clock::now() + std::chrono::seconds(request.timeout_seconds);

    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();
    dev_null.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        reap(pid, &status);
        throw SpawnError("Failed to execute command '" + request.command + "': " + std::strerror(exec_errno));
    }

    log_debug("exec[" + std::to_string(pid) + "] " + request.command);

    StreamCapture streams[2];
    streams[0].fd = std::move(out.read_end);
    streams[1].fd = std::move(err.read_end);
    for (auto& s : streams) {
        s.cap = limits_.max_output_bytes;
        int flags = ::fcntl(s.fd.get(), F_GETFL, 0);
        if (flags >= 0) ::fcntl(s.fd.get(), F_SETFL, flags | O_NONBLOCK);
    }

    while (streams[0].fd.valid() || streams[1].fd.valid()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            kill_group_and_timeout(pid, request);
        }

        struct pollfd pfds[2];
        StreamCapture* owners[2];
        nfds_t count = 0;
        for (auto& s : streams) {
            if (!s.fd.valid()) continue;
            pfds[count].fd = s.fd.get();
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            owners[count] = &s;
            ++count;
        }

        int rc = ::poll(pfds, count, static_cast<int>(std::min<long long>(remaining, 100)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            ::killpg(pid, SIGKILL);
            int status = 0;
            reap(pid, &status);
            throw SpawnError("Failed to wait for command '" + request.command + "': " + std::strerror(e));
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (pfds[i].revents != 0) {
                owners[i]->drain();
            }
        }
    }

    // both streams closed; the shell may still be finishing up
    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            throw SpawnError("Failed to wait for command '" + request.command + "': " + std::strerror(errno));
        }
        if (Clock::now() >= deadline) {
            kill_group_and_timeout(pid, request);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ExecutionResult result;
    result.exit_code = decode_wait_status(status);
    result.success = result.exit_code == 0;
    result.stdout_text = sanitize_utf8(streams[0].data);
    result.stderr_text = sanitize_utf8(streams[1].data);
    result.stdout_truncated = streams[0].truncated;
    result.stderr_truncated = streams[1].truncated;
    log_debug("exec[" + std::to_string(pid) + "] exit " + std::to_string(result.exit_code));
    return result;
}

} // namespace tmpltool
