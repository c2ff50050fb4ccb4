/**
 * @file syscall_filter.hpp
 * @brief Seccomp program that routes capability-relevant syscalls to the supervisor.
 * @author CodeVerdict contributors
 *
 * The program is compiled with libseccomp in the supervising process and
 * exported as raw BPF, so the forked child only has to hand it to prctl().
 * Syscalls that may exercise a denied capability are marked with
 * SECCOMP_RET_TRACE; the data word tells the supervisor which check to run.
 */

#pragma once

#include "core/result.hpp"
#include "sandbox/capability_policy.hpp"

#include <linux/filter.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

/// Data word carried by a SECCOMP_RET_TRACE stop.
enum class TraceTag : uint16_t {
    Exec = 1,
    Spawn = 2,
    Network = 3,
    Signal = 4,
    Open = 5,                 ///< open/openat, watched while environment_access is denied
    FileMutationBase = 0x100  ///< plus the index into mutating_syscalls()
};

/// A (dirfd, path) pair of syscall arguments. dirfd_arg < 0 means relative to the cwd.
struct PathOperand {
    int dirfd_arg;
    int path_arg;
};

/// path_arg value for syscalls that take no path: dirfd_arg is the file being changed.
inline constexpr int kDescriptorOperand = -2;

/**
 * @brief A syscall that creates, modifies or removes a filesystem entry.
 *
 * When @c flags_arg is set the syscall only mutates when its open flags ask for
 * write access, creation or truncation.
 */
struct MutatingSyscall {
    std::string_view name;
    PathOperand first;
    PathOperand second{-1, -1};
    int flags_arg{-1};
};

[[nodiscard]] std::span<const MutatingSyscall> mutating_syscalls() noexcept;

/// Whether open(2) @p flags ask for write access, creation or truncation.
[[nodiscard]] bool opens_for_writing(uint64_t flags) noexcept;

class SyscallFilter {
public:
    /// Compile the program for @p policy on the native architecture.
    static Result<SyscallFilter> compile(const CapabilityPolicy& policy);

    /// Program descriptor for PR_SET_SECCOMP. Valid while this object lives.
    [[nodiscard]] sock_fprog program() const noexcept;

    [[nodiscard]] size_t instruction_count() const noexcept { return instructions_.size(); }

    /// Symbolic name of a native syscall number, or "syscall_<nr>".
    [[nodiscard]] static std::string syscall_name(long number);

private:
    explicit SyscallFilter(std::vector<sock_filter> instructions)
        : instructions_(std::move(instructions)) {}

    std::vector<sock_filter> instructions_;
};

/**
 * @brief Set no_new_privs and install @p program on the calling thread.
 *
 * Async-signal-safe; meant to run in a freshly forked child.
 * @return 0 on success, otherwise the errno of the failing prctl().
 */
int install_seccomp_program(const sock_fprog& program) noexcept;

}  // namespace code_verdict
