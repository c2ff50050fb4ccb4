/**
 * @file isolation_boundary.cpp
 * @brief Fork, contain and supervise one untrusted process.
 * @author CodeVerdict contributors
 */

#include "sandbox/isolation_boundary.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/tracee.hpp"
#include "sandbox/unique_fd.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/ptrace.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace code_verdict {

namespace {

// ─────────────────────────────────────────────
// Child side (async-signal-safe only)
// ─────────────────────────────────────────────

enum class ChildStage : int {
    Setup = 1,
    Descriptors,
    Workdir,
    Limits,
    Trace,
    Filter,
    Exec
};

constexpr std::string_view to_string(ChildStage stage) noexcept {
    switch (stage) {
        case ChildStage::Setup:       return "process setup";
        case ChildStage::Descriptors: return "descriptor setup";
        case ChildStage::Workdir:     return "entering scratch directory";
        case ChildStage::Limits:      return "applying resource limits";
        case ChildStage::Trace:       return "attaching supervisor";
        case ChildStage::Filter:      return "installing syscall filter";
        case ChildStage::Exec:        return "exec";
    }
    return "unknown stage";
}

/// Written to the status pipe when the child cannot reach exec.
struct ChildFailure {
    int stage;
    int error;
};

constexpr int kChannelFd = 3;
constexpr int kStatusFd = 4;
constexpr int kRelocationFloor = 10;
constexpr rlim_t kOpenFileLimit = 256;

/// Whether @p path names some process's environ file under /proc, directly or through symlinks.
bool names_process_environ(const std::filesystem::path& path) {
    const auto in_proc = [](const std::filesystem::path& p) {
        auto it = p.begin();
        return p.is_absolute() && it != p.end() && ++it != p.end() && *it == "proc"
            && p.filename() == "environ";
    };
    if (in_proc(path.lexically_normal())) return true;
    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(path, ec);
    return !ec && in_proc(resolved);
}

struct ChildSetup {
    std::array<int, 5> fds;   ///< stdin, stdout, stderr, channel, status
    const char* workdir;
    const char* executable;
    char* const* argv;
    char* const* envp;
    sock_fprog program;
    std::array<std::pair<int, rlimit>, 5> limits;
};

[[noreturn]] void fail_child(int status_fd, ChildStage stage) noexcept {
    const ChildFailure failure{static_cast<int>(stage), errno};
    [[maybe_unused]] ssize_t written = ::write(status_fd, &failure, sizeof(failure));
    ::_exit(127);
}

[[noreturn]] void run_child(const ChildSetup& setup) noexcept {
    int status_fd = setup.fds[4];

    sigset_t empty;
    ::sigemptyset(&empty);
    if (::sigprocmask(SIG_SETMASK, &empty, nullptr) != 0) fail_child(status_fd, ChildStage::Setup);
    if (::setpgid(0, 0) != 0) fail_child(status_fd, ChildStage::Setup);
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) fail_child(status_fd, ChildStage::Setup);

    // Move every source above the target range first so no dup2 clobbers a later source.
    std::array<int, 5> moved{};
    for (size_t i = 0; i < moved.size(); ++i) {
        moved[i] = ::fcntl(setup.fds[i], F_DUPFD_CLOEXEC, kRelocationFloor);
        if (moved[i] < 0) fail_child(status_fd, ChildStage::Descriptors);
    }
    status_fd = moved[4];
    for (int target = 0; target <= kChannelFd; ++target) {
        if (::dup2(moved[static_cast<size_t>(target)], target) < 0) {
            fail_child(status_fd, ChildStage::Descriptors);
        }
    }
    if (::dup3(moved[4], kStatusFd, O_CLOEXEC) < 0) fail_child(status_fd, ChildStage::Descriptors);
    status_fd = kStatusFd;
    if (::syscall(SYS_close_range, kStatusFd + 1, ~0U, 0) != 0) {
        rlimit nofile{};
        const rlim_t last = ::getrlimit(RLIMIT_NOFILE, &nofile) == 0
                                ? std::min<rlim_t>(nofile.rlim_cur, 65536) : 1024;
        for (rlim_t fd = kStatusFd + 1; fd < last; ++fd) ::close(static_cast<int>(fd));
    }

    if (::chdir(setup.workdir) != 0) fail_child(status_fd, ChildStage::Workdir);

    for (const auto& [resource, limit] : setup.limits) {
        if (::setrlimit(resource, &limit) != 0) fail_child(status_fd, ChildStage::Limits);
    }

    if (::ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) != 0) fail_child(status_fd, ChildStage::Trace);
    // Wait for the supervisor to set tracing options.
    if (::raise(SIGSTOP) != 0) fail_child(status_fd, ChildStage::Trace);

    if (int rc = install_seccomp_program(setup.program); rc != 0) {
        errno = rc;
        fail_child(status_fd, ChildStage::Filter);
    }

    ::execve(setup.executable, setup.argv, setup.envp);
    fail_child(status_fd, ChildStage::Exec);
}

// ─────────────────────────────────────────────
// Supervisor side
// ─────────────────────────────────────────────

/// Owns the strings behind a NULL-terminated char* array for execve.
class CStringArray {
public:
    explicit CStringArray(const std::vector<std::string>& items) : storage_(items) {
        pointers_.reserve(storage_.size() + 1);
        for (auto& item : storage_) pointers_.push_back(item.data());
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] char* const* get() const noexcept { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Io, std::string{"pipe2(): "} + std::strerror(errno)};
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

bool is_stop_signal(int sig) noexcept {
    return sig == SIGSTOP || sig == SIGTSTP || sig == SIGTTIN || sig == SIGTTOU;
}

Duration cpu_time(const rusage& usage) noexcept {
    using std::chrono::seconds;
    using std::chrono::microseconds;
    return seconds{usage.ru_utime.tv_sec + usage.ru_stime.tv_sec}
         + microseconds{usage.ru_utime.tv_usec + usage.ru_stime.tv_usec};
}

/// Kill and reap a child that never became a supervised tracee.
void reap_after_kill(pid_t pid) noexcept {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, __WALL) < 0 && errno == EINTR) {}
}

/**
 * @brief Drives one traced process tree until its main process is gone.
 *
 * Lives on the thread that forked the child: ptrace requests are only
 * accepted from the tracer thread.
 */
class Supervisor {
public:
    Supervisor(pid_t main, const CapabilityPolicy& policy, const ScratchEnvironment& scratch)
        : main_(main), policy_(policy), scratch_(scratch) {
        pidfd_.reset(static_cast<int>(::syscall(SYS_pidfd_open, main, 0)));
        live_.insert(main);
    }

    /// Safe from any thread; the main pid is never signalled after it was reaped.
    void kill_main() noexcept {
        if (pidfd_.valid()) {
            ::syscall(SYS_pidfd_send_signal, pidfd_.get(), SIGKILL, nullptr, 0);
            return;
        }
        std::lock_guard lock(reap_mutex_);
        if (!main_reaped_) ::kill(main_, SIGKILL);
    }

    void set_limit_fired() noexcept { limit_fired_.store(true); }

    /// Wait for the initial SIGSTOP and configure tracing.
    Result<void> attach() {
        int status = 0;
        while (::waitpid(main_, &status, __WALL) < 0) {
            if (errno != EINTR) {
                return Error{ErrorCode::Sandbox, std::string{"waitpid(): "} + std::strerror(errno)};
            }
        }
        if (!WIFSTOPPED(status)) {
            mark_reaped(status, rusage{});
            return Error{ErrorCode::Sandbox, "child exited before tracing started"};
        }

        constexpr long kOptions = PTRACE_O_TRACESECCOMP | PTRACE_O_EXITKILL | PTRACE_O_TRACEEXEC
                                | PTRACE_O_TRACEFORK | PTRACE_O_TRACEVFORK | PTRACE_O_TRACECLONE;
        if (::ptrace(PTRACE_SETOPTIONS, main_, nullptr, reinterpret_cast<void*>(kOptions)) != 0
            || ::ptrace(PTRACE_CONT, main_, nullptr, nullptr) != 0) {
            std::string reason = std::strerror(errno);
            reap_after_kill(main_);
            mark_reaped(0, rusage{});
            return Error{ErrorCode::Sandbox, "ptrace setup failed: " + reason};
        }
        return {};
    }

    /// Process stops until every tracee is gone.
    void supervise() {
        while (!live_.empty()) {
            int status = 0;
            rusage usage{};
            const pid_t pid = ::wait4(-1, &status, __WALL | __WNOTHREAD, &usage);
            if (pid < 0) {
                if (errno == EINTR) continue;
                break;  // ECHILD: nothing left to wait for
            }

            if (WIFEXITED(status) || WIFSIGNALED(status)) {
                live_.erase(pid);
                if (pid == main_) {
                    mark_reaped(status, usage);
                    kill_remaining();
                }
                continue;
            }
            if (!WIFSTOPPED(status)) continue;

            const bool first_stop = live_.insert(pid).second;
            const int sig = WSTOPSIG(status);
            const int event = status >> 16;

            if (sig == SIGTRAP && event == PTRACE_EVENT_SECCOMP) {
                unsigned long data = 0;
                if (::ptrace(PTRACE_GETEVENTMSG, pid, nullptr, &data) != 0) continue;
                if (auto violation = inspect(pid, static_cast<uint16_t>(data))) {
                    if (!violation_ && !limit_fired_.load()) violation_ = std::move(violation);
                    kill_remaining();
                    continue;  // left stopped; SIGKILL ends it
                }
                resume(pid, 0);
                continue;
            }
            if (sig == SIGTRAP && event != 0) {
                resume(pid, 0);
                continue;
            }
            if (first_stop || is_stop_signal(sig)) {
                resume(pid, 0);
                continue;
            }
            resume(pid, sig);
        }
    }

    [[nodiscard]] const std::optional<Violation>& violation() const noexcept { return violation_; }
    [[nodiscard]] int main_status() const noexcept { return main_status_; }
    [[nodiscard]] const rusage& main_usage() const noexcept { return main_usage_; }
    [[nodiscard]] SteadyTime finished_at() const noexcept { return finished_at_; }

private:
    /// ESRCH here means the tracee was killed meanwhile; wait4 reports its exit.
    void resume(pid_t pid, int sig) noexcept {
        ::ptrace(PTRACE_CONT, pid, nullptr, reinterpret_cast<void*>(static_cast<long>(sig)));
    }

    void mark_reaped(int status, const rusage& usage) {
        std::lock_guard lock(reap_mutex_);
        main_reaped_ = true;
        main_status_ = status;
        main_usage_ = usage;
        finished_at_ = std::chrono::steady_clock::now();
    }

    void kill_remaining() noexcept {
        for (pid_t pid : live_) {
            if (pid == main_) kill_main();
            else ::kill(pid, SIGKILL);
        }
    }

    std::optional<Violation> inspect(pid_t pid, uint16_t tag) {
        auto regs = read_syscall_registers(pid);
        if (!regs) return deny_unreadable(tag);
        const std::string name = SyscallFilter::syscall_name(regs->number);

        switch (static_cast<TraceTag>(tag)) {
            case TraceTag::Exec: {
                if (!interpreter_started_ && pid == main_) {
                    interpreter_started_ = true;
                    return std::nullopt;
                }
                if (policy_.allows(Capability::ProcessSpawn)) return std::nullopt;
                const uint64_t path_arg = regs->number == SYS_execve ? regs->args[0] : regs->args[1];
                auto target = read_tracee_string(pid, path_arg).value_or("?");
                return Violation{Capability::ProcessSpawn, name + "(" + target + ")"};
            }
            case TraceTag::Spawn:
                return Violation{Capability::ProcessSpawn, name};
            case TraceTag::Network:
                return Violation{Capability::Network,
                                 name + "(domain=" + std::to_string(regs->args[0]) + ")"};
            case TraceTag::Signal:
                return inspect_signal(*regs, name);
            case TraceTag::Open:
                return inspect_open(pid, *regs, name);
            default:
                break;
        }

        const auto base = static_cast<uint16_t>(TraceTag::FileMutationBase);
        const auto table = mutating_syscalls();
        if (tag < base || static_cast<size_t>(tag - base) >= table.size()) {
            return Violation{Capability::FilesystemWrite, "unrecognised trap " + std::to_string(tag)};
        }
        return inspect_file_mutation(pid, table[tag - base], *regs);
    }

    std::optional<Violation> inspect_signal(const SyscallRegisters& regs, const std::string& name) const {
        const auto target = static_cast<pid_t>(static_cast<int32_t>(regs.args[0]));
        bool own = false;
        if (regs.number == SYS_kill) {
            own = target == 0 || target == main_ || target == -main_ || live_.contains(target);
        } else {
            own = target > 0 && live_.contains(target);
        }
        if (own) return std::nullopt;
        return Violation{Capability::ProcessControl, name + "(" + std::to_string(target) + ")"};
    }

    /// Reading the environment through procfs; write opens go on to the mutation check.
    std::optional<Violation> inspect_open(pid_t pid, const SyscallRegisters& regs,
                                          const std::string& name) const {
        const auto table = mutating_syscalls();
        const auto entry = std::find_if(table.begin(), table.end(),
                                        [&](const MutatingSyscall& e) { return e.name == name; });
        if (entry == table.end() || entry->flags_arg < 0) {
            return Violation{Capability::EnvironmentAccess, "unrecognised open trap " + name};
        }

        if (auto path = operand_path(pid, entry->first, regs); path && names_process_environ(*path)) {
            return Violation{Capability::EnvironmentAccess, name + "(" + path->string() + ")"};
        }

        const uint64_t flags = regs.args[static_cast<size_t>(entry->flags_arg)];
        if (!policy_.allows(Capability::FilesystemWrite) && opens_for_writing(flags)) {
            return inspect_file_mutation(pid, *entry, regs);
        }
        return std::nullopt;
    }

    std::optional<Violation> inspect_file_mutation(pid_t pid, const MutatingSyscall& entry,
                                                   const SyscallRegisters& regs) const {
        for (const auto& operand : {entry.first, entry.second}) {
            if (operand.path_arg < 0 && operand.path_arg != kDescriptorOperand) continue;
            auto resolved = operand_path(pid, operand, regs);
            if (resolved && write_allowed(*resolved)) continue;

            std::string shown = "?";
            if (resolved) {
                shown = resolved->string();
            } else if (operand.path_arg == kDescriptorOperand) {
                shown = "fd " + std::to_string(static_cast<int32_t>(regs.args[static_cast<size_t>(operand.dirfd_arg)]));
            }
            return Violation{Capability::FilesystemWrite, std::string{entry.name} + "(" + shown + ")"};
        }
        return std::nullopt;
    }

    /// Absolute path named by @p operand, or nullopt when it cannot be read or resolved.
    static std::optional<std::filesystem::path> operand_path(pid_t pid, const PathOperand& operand,
                                                             const SyscallRegisters& regs) {
        const int dirfd = operand.dirfd_arg < 0
                              ? AT_FDCWD
                              : static_cast<int32_t>(regs.args[static_cast<size_t>(operand.dirfd_arg)]);
        if (operand.path_arg == kDescriptorOperand) {
            // An empty path resolves to what the descriptor refers to.
            return resolve_tracee_path(pid, dirfd, "");
        }
        auto raw = read_tracee_string(pid, regs.args[static_cast<size_t>(operand.path_arg)]);
        if (!raw) return std::nullopt;
        return resolve_tracee_path(pid, dirfd, *raw);
    }

    bool write_allowed(const std::filesystem::path& path) const {
        return path == "/dev/null" || scratch_.contains(path);
    }

    static std::optional<Violation> deny_unreadable(uint16_t tag) {
        Capability capability = Capability::FilesystemWrite;
        switch (static_cast<TraceTag>(tag)) {
            case TraceTag::Exec:
            case TraceTag::Spawn:   capability = Capability::ProcessSpawn; break;
            case TraceTag::Network: capability = Capability::Network; break;
            case TraceTag::Signal:  capability = Capability::ProcessControl; break;
            case TraceTag::Open:    capability = Capability::EnvironmentAccess; break;
            default: break;
        }
        return Violation{capability, "syscall arguments unreadable"};
    }

    pid_t main_;
    const CapabilityPolicy& policy_;
    const ScratchEnvironment& scratch_;
    UniqueFd pidfd_;
    std::unordered_set<pid_t> live_;
    bool interpreter_started_{false};
    std::optional<Violation> violation_;
    std::atomic<bool> limit_fired_{false};

    std::mutex reap_mutex_;
    bool main_reaped_{false};
    int main_status_{0};
    rusage main_usage_{};
    SteadyTime finished_at_{};
};

ChildFailure read_child_failure(int fd) {
    ChildFailure failure{0, 0};
    auto* out = reinterpret_cast<char*>(&failure);
    size_t done = 0;
    while (done < sizeof(failure)) {
        ssize_t n = ::read(fd, out + done, sizeof(failure) - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        done += static_cast<size_t>(n);
    }
    if (done != sizeof(failure)) return ChildFailure{0, 0};
    return failure;
}

}  // namespace

// ─────────────────────────────────────────────
// IsolationBoundary
// ─────────────────────────────────────────────

Result<std::unique_ptr<IsolationBoundary>> IsolationBoundary::create(BoundaryOptions options) {
    if (options.scratch_root.empty()) {
        return Error{ErrorCode::Config, "scratch root must be set"};
    }
    auto filter = SyscallFilter::compile(options.policy);
    if (!filter) return filter.error();
    return std::unique_ptr<IsolationBoundary>(
        new IsolationBoundary(std::move(options), std::move(*filter)));
}

Result<ScratchEnvironment> IsolationBoundary::provision() const {
    return ScratchEnvironment::provision(options_.scratch_root);
}

Result<SandboxOutcome> IsolationBoundary::run(const ScratchEnvironment& scratch,
                                              const LaunchSpec& launch,
                                              const ResourceLimits& limits,
                                              std::stop_token stop) const {
    if (stop.stop_requested()) return Error{ErrorCode::Cancelled, "execution cancelled"};
    if (launch.argv.empty()) return Error{ErrorCode::Internal, "launch argv is empty"};
    if (scratch.path().empty()) return Error{ErrorCode::Sandbox, "scratch environment is torn down"};

    auto out_pipe = make_pipe();
    if (!out_pipe) return out_pipe.error();
    auto err_pipe = make_pipe();
    if (!err_pipe) return err_pipe.error();
    auto channel_pipe = make_pipe();
    if (!channel_pipe) return channel_pipe.error();
    auto status_pipe = make_pipe();
    if (!status_pipe) return status_pipe.error();

    UniqueFd devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (!devnull.valid()) {
        return Error{ErrorCode::Io, std::string{"open(/dev/null): "} + std::strerror(errno)};
    }

    // Everything the child touches is prepared before fork().
    const CStringArray argv{launch.argv};
    const CStringArray envp{launch.env};
    const std::string executable = launch.executable.string();
    const std::string workdir = scratch.path().string();

    const auto cpu_seconds = static_cast<rlim_t>(
        std::max<int64_t>(1, (limits.cpu_timeout.count() + 999'999) / 1'000'000));
    const auto memory = static_cast<rlim_t>(limits.memory_ceiling_bytes);
    const auto file_size = static_cast<rlim_t>(options_.max_file_size_bytes);

    const ChildSetup setup{
        .fds = {devnull.get(), out_pipe->write_end.get(), err_pipe->write_end.get(),
                channel_pipe->write_end.get(), status_pipe->write_end.get()},
        .workdir = workdir.c_str(),
        .executable = executable.c_str(),
        .argv = argv.get(),
        .envp = envp.get(),
        .program = filter_.program(),
        .limits = {{
            {RLIMIT_AS, rlimit{memory, memory}},
            {RLIMIT_CPU, rlimit{cpu_seconds, cpu_seconds + 1}},
            {RLIMIT_CORE, rlimit{0, 0}},
            {RLIMIT_FSIZE, rlimit{file_size, file_size}},
            {RLIMIT_NOFILE, rlimit{kOpenFileLimit, kOpenFileLimit}},
        }},
    };

    const SteadyTime started = std::chrono::steady_clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) return Error{ErrorCode::Sandbox, std::string{"fork(): "} + std::strerror(errno)};
    if (pid == 0) run_child(setup);

    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    channel_pipe->write_end.reset();
    status_pipe->write_end.reset();
    devnull.reset();

    BoundedBuffer stdout_buffer{limits.output_cap_bytes};
    BoundedBuffer stderr_buffer{limits.output_cap_bytes};
    BoundedBuffer channel_buffer{options_.channel_cap_bytes};
    std::jthread pump([&](std::stop_token pump_stop) {
        pump_streams({{out_pipe->read_end.get(), &stdout_buffer},
                      {err_pipe->read_end.get(), &stderr_buffer},
                      {channel_pipe->read_end.get(), &channel_buffer}},
                     pump_stop);
    });

    Supervisor supervisor{pid, options_.policy, scratch};
    if (auto attached = supervisor.attach(); !attached) {
        pump.request_stop();
        pump.join();
        const auto failure = read_child_failure(status_pipe->read_end.get());
        if (failure.stage != 0) {
            return Error{ErrorCode::Sandbox,
                         "cannot start '" + executable + "': "
                             + std::string{to_string(static_cast<ChildStage>(failure.stage))}
                             + ": " + std::strerror(failure.error)};
        }
        return attached.error();
    }

    // ── Watchdog: wall deadline and external cancellation ──
    std::atomic<bool> timed_out{false};
    std::atomic<bool> cancelled{false};
    std::mutex watchdog_mutex;
    std::condition_variable_any watchdog_cv;
    const auto deadline = started + limits.wall_timeout;

    std::jthread watchdog([&](std::stop_token own) {
        std::stop_callback on_cancel(stop, [&] {
            { std::lock_guard lock(watchdog_mutex); }
            watchdog_cv.notify_all();
        });
        std::unique_lock lock(watchdog_mutex);
        const bool cancel = watchdog_cv.wait_until(lock, own, deadline,
                                                   [&] { return stop.stop_requested(); });
        if (own.stop_requested()) return;
        if (cancel) cancelled.store(true);
        else timed_out.store(true);
        supervisor.set_limit_fired();
        supervisor.kill_main();
    });

    supervisor.supervise();

    watchdog.request_stop();
    watchdog.join();
    pump.request_stop();
    pump.join();

    const auto failure = read_child_failure(status_pipe->read_end.get());
    if (failure.stage != 0) {
        return Error{ErrorCode::Sandbox,
                     "cannot start '" + executable + "': "
                         + std::string{to_string(static_cast<ChildStage>(failure.stage))}
                         + ": " + std::strerror(failure.error)};
    }
    if (cancelled.load()) return Error{ErrorCode::Cancelled, "execution cancelled"};

    SandboxOutcome outcome;
    const int status = supervisor.main_status();
    if (WIFEXITED(status)) outcome.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) outcome.term_signal = WTERMSIG(status);
    outcome.timed_out = timed_out.load();
    outcome.violation = supervisor.violation();

    const Duration cpu_used = cpu_time(supervisor.main_usage());
    if (outcome.term_signal == SIGXCPU) {
        outcome.cpu_limit_exceeded = true;
    } else if (outcome.term_signal == SIGKILL && !outcome.timed_out && !outcome.violation) {
        outcome.cpu_limit_exceeded = cpu_used >= std::chrono::seconds{cpu_seconds};
    }

    outcome.stdout_stream = CapturedStream{stdout_buffer.text(), stdout_buffer.truncated()};
    outcome.stderr_stream = CapturedStream{stderr_buffer.text(), stderr_buffer.truncated()};
    outcome.channel = channel_buffer.raw();
    outcome.wall_time = std::chrono::duration_cast<Duration>(supervisor.finished_at() - started);
    outcome.peak_memory_bytes = static_cast<uint64_t>(supervisor.main_usage().ru_maxrss) * 1024;
    return outcome;
}

}  // namespace code_verdict
