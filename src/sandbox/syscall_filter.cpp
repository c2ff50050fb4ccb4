/**
 * @file syscall_filter.cpp
 * @brief libseccomp program construction and BPF export.
 * @author CodeVerdict contributors
 */

#include "sandbox/syscall_filter.hpp"
#include "sandbox/unique_fd.hpp"

#include <fcntl.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <optional>

namespace code_verdict {

namespace {

constexpr std::array<MutatingSyscall, 35> kMutatingSyscalls = {{
    {.name = "open", .first = {-1, 0}, .flags_arg = 1},
    {.name = "openat", .first = {0, 1}, .flags_arg = 2},
    {.name = "creat", .first = {-1, 0}},
    {.name = "mkdir", .first = {-1, 0}},
    {.name = "mkdirat", .first = {0, 1}},
    {.name = "mknod", .first = {-1, 0}},
    {.name = "mknodat", .first = {0, 1}},
    {.name = "unlink", .first = {-1, 0}},
    {.name = "unlinkat", .first = {0, 1}},
    {.name = "rmdir", .first = {-1, 0}},
    {.name = "rename", .first = {-1, 0}, .second = {-1, 1}},
    {.name = "renameat", .first = {0, 1}, .second = {2, 3}},
    {.name = "renameat2", .first = {0, 1}, .second = {2, 3}},
    {.name = "link", .first = {-1, 1}, .second = {-1, 0}},
    {.name = "linkat", .first = {2, 3}, .second = {0, 1}},
    {.name = "symlink", .first = {-1, 1}},
    {.name = "symlinkat", .first = {1, 2}},
    {.name = "truncate", .first = {-1, 0}},
    {.name = "chmod", .first = {-1, 0}},
    {.name = "fchmodat", .first = {0, 1}},
    {.name = "fchmod", .first = {0, kDescriptorOperand}},
    {.name = "chown", .first = {-1, 0}},
    {.name = "lchown", .first = {-1, 0}},
    {.name = "fchownat", .first = {0, 1}},
    {.name = "fchown", .first = {0, kDescriptorOperand}},
    {.name = "utime", .first = {-1, 0}},
    {.name = "utimes", .first = {-1, 0}},
    {.name = "utimensat", .first = {0, 1}},
    {.name = "futimesat", .first = {0, 1}},
    {.name = "setxattr", .first = {-1, 0}},
    {.name = "lsetxattr", .first = {-1, 0}},
    {.name = "removexattr", .first = {-1, 0}},
    {.name = "lremovexattr", .first = {-1, 0}},
    {.name = "fsetxattr", .first = {0, kDescriptorOperand}},
    {.name = "fremovexattr", .first = {0, kDescriptorOperand}},
}};

/// Open flags that turn an open into a mutation.
constexpr std::array<uint64_t, 4> kWriteOpenFlags = {O_WRONLY, O_RDWR, O_CREAT, O_TRUNC};

constexpr std::array<std::string_view, 25> kAlwaysDenied = {
    "ptrace", "process_vm_writev", "mount", "umount2", "pivot_root", "chroot",
    "setns", "unshare", "reboot", "kexec_load", "kexec_file_load", "init_module",
    "finit_module", "delete_module", "bpf", "perf_event_open", "keyctl", "add_key",
    "request_key", "userfaultfd", "swapon", "swapoff", "acct", "sethostname",
    "setdomainname",
};

/// Denied with ENOSYS so that libc falls back to the older, filtered variant.
constexpr std::array<std::string_view, 6> kUnsupported = {
    "clone3", "io_uring_setup", "io_uring_enter", "io_uring_register", "openat2", "fchmodat2",
};

uint32_t trace_action(TraceTag tag) noexcept {
    return SCMP_ACT_TRACE(static_cast<uint16_t>(tag));
}

scmp_arg_cmp masked_eq(unsigned arg, uint64_t mask, uint64_t value) noexcept {
    return scmp_arg_cmp{.arg = arg, .op = SCMP_CMP_MASKED_EQ, .datum_a = mask, .datum_b = value};
}

/// Collects rules into a libseccomp context, remembering the first failure.
class RuleSet {
public:
    explicit RuleSet(scmp_filter_ctx ctx) : ctx_(ctx) {}

    void add(uint32_t action, std::string_view name,
             std::initializer_list<scmp_arg_cmp> conditions = {}) {
        if (failure_) return;
        const std::string syscall{name};
        const int number = seccomp_syscall_resolve_name(syscall.c_str());
        // Negative numbers are pseudo-syscalls that do not exist natively.
        if (number == __NR_SCMP_ERROR || number < 0) return;

        const int rc = seccomp_rule_add_array(ctx_, action, number,
                                              static_cast<unsigned>(conditions.size()),
                                              conditions.begin());
        if (rc < 0) {
            failure_ = Error{ErrorCode::Sandbox, "seccomp_rule_add(" + syscall + "): "
                                                     + std::strerror(-rc)};
        }
    }

    [[nodiscard]] const std::optional<Error>& failure() const noexcept { return failure_; }

private:
    scmp_filter_ctx ctx_;
    std::optional<Error> failure_;
};

Result<std::vector<sock_filter>> export_program(scmp_filter_ctx ctx) {
    UniqueFd memfd{::memfd_create("code_verdict seccomp", MFD_CLOEXEC)};
    if (!memfd.valid()) {
        return Error{ErrorCode::Sandbox, std::string{"memfd_create(): "} + std::strerror(errno)};
    }
    if (int rc = seccomp_export_bpf(ctx, memfd.get()); rc < 0) {
        return Error{ErrorCode::Sandbox, std::string{"seccomp_export_bpf(): "} + std::strerror(-rc)};
    }

    struct stat st{};
    if (::fstat(memfd.get(), &st) != 0) {
        return Error{ErrorCode::Sandbox, std::string{"fstat(): "} + std::strerror(errno)};
    }
    const auto size = static_cast<size_t>(st.st_size);
    if (size == 0 || size % sizeof(sock_filter) != 0) {
        return Error{ErrorCode::Sandbox, "exported seccomp program has invalid length "
                                             + std::to_string(size)};
    }

    std::vector<sock_filter> instructions(size / sizeof(sock_filter));
    auto* out = reinterpret_cast<char*>(instructions.data());
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pread(memfd.get(), out + done, size - done, static_cast<off_t>(done));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            return Error{ErrorCode::Sandbox, std::string{"pread(): "}
                                                 + (n < 0 ? std::strerror(errno) : "short read")};
        }
        done += static_cast<size_t>(n);
    }
    return instructions;
}

}  // namespace

std::span<const MutatingSyscall> mutating_syscalls() noexcept {
    return kMutatingSyscalls;
}

bool opens_for_writing(uint64_t flags) noexcept {
    return std::any_of(kWriteOpenFlags.begin(), kWriteOpenFlags.end(),
                       [flags](uint64_t flag) { return (flags & flag) != 0; });
}

Result<SyscallFilter> SyscallFilter::compile(const CapabilityPolicy& policy) {
    std::unique_ptr<void, void (*)(scmp_filter_ctx)> ctx{seccomp_init(SCMP_ACT_ALLOW),
                                                         &seccomp_release};
    if (!ctx) return Error{ErrorCode::Sandbox, "seccomp_init() failed"};

    // Syscalls entered through a foreign ABI (e.g. int 0x80 on x86_64) bypass the rules below.
    if (int rc = seccomp_attr_set(ctx.get(), SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_KILL_PROCESS); rc < 0) {
        return Error{ErrorCode::Sandbox, std::string{"seccomp_attr_set(): "} + std::strerror(-rc)};
    }

    RuleSet rules{ctx.get()};

    for (auto name : kAlwaysDenied) rules.add(SCMP_ACT_ERRNO(EPERM), name);
    for (auto name : kUnsupported) rules.add(SCMP_ACT_ERRNO(ENOSYS), name);

    // The supervisor lets the interpreter's own exec through.
    rules.add(trace_action(TraceTag::Exec), "execve");
    rules.add(trace_action(TraceTag::Exec), "execveat");

    if (!policy.allows(Capability::ProcessSpawn)) {
        rules.add(trace_action(TraceTag::Spawn), "fork");
        rules.add(trace_action(TraceTag::Spawn), "vfork");
        rules.add(trace_action(TraceTag::Spawn), "clone", {masked_eq(0, CLONE_THREAD, 0)});
    }

    if (!policy.allows(Capability::Network)) {
        rules.add(trace_action(TraceTag::Network), "socket");
    }

    if (!policy.allows(Capability::ProcessControl)) {
        rules.add(trace_action(TraceTag::Signal), "kill");
        rules.add(trace_action(TraceTag::Signal), "tkill");
        rules.add(trace_action(TraceTag::Signal), "tgkill");
    }

    // Every open is inspected for /proc/<pid>/environ; write opens are checked there too.
    const bool watch_opens = !policy.allows(Capability::EnvironmentAccess);
    if (watch_opens) {
        rules.add(trace_action(TraceTag::Open), "open");
        rules.add(trace_action(TraceTag::Open), "openat");
    }

    if (!policy.allows(Capability::FilesystemWrite)) {
        for (size_t i = 0; i < kMutatingSyscalls.size(); ++i) {
            const auto& entry = kMutatingSyscalls[i];
            if (watch_opens && entry.flags_arg >= 0) continue;
            const auto tag = static_cast<uint16_t>(static_cast<uint16_t>(TraceTag::FileMutationBase) + i);
            const uint32_t action = SCMP_ACT_TRACE(tag);
            if (entry.flags_arg < 0) {
                rules.add(action, entry.name);
                continue;
            }
            const auto flags_arg = static_cast<unsigned>(entry.flags_arg);
            for (uint64_t flag : kWriteOpenFlags) {
                rules.add(action, entry.name, {masked_eq(flags_arg, flag, flag)});
            }
        }
    }

    if (const auto& failure = rules.failure()) return *failure;

    auto instructions = export_program(ctx.get());
    if (!instructions) return instructions.error();
    return SyscallFilter{std::move(*instructions)};
}

sock_fprog SyscallFilter::program() const noexcept {
    return sock_fprog{
        .len = static_cast<unsigned short>(instructions_.size()),
        .filter = const_cast<sock_filter*>(instructions_.data()),
    };
}

std::string SyscallFilter::syscall_name(long number) {
    char* name = seccomp_syscall_resolve_num_arch(SCMP_ARCH_NATIVE, static_cast<int>(number));
    if (name == nullptr) return "syscall_" + std::to_string(number);
    std::string result{name};
    std::free(name);
    return result;
}

int install_seccomp_program(const sock_fprog& program) noexcept {
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return errno;
    if (::syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &program) != 0) return errno;
    return 0;
}

}  // namespace code_verdict
