/**
 * @file tracee.cpp
 * @brief Tracee register and memory access for the native architecture.
 * @author CodeVerdict contributors
 */

#include "sandbox/tracee.hpp"

#include <elf.h>
#include <fcntl.h>
#include <sys/ptrace.h>
#include <sys/uio.h>
#include <sys/user.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace code_verdict {

namespace {

constexpr uint64_t kPageSize = 4096;

std::optional<std::filesystem::path> read_proc_link(const std::string& link) {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(link, ec);
    if (ec || !target.is_absolute()) return std::nullopt;
    return target;
}

}  // namespace

Result<SyscallRegisters> read_syscall_registers(pid_t tracee) {
    user_regs_struct regs{};
    iovec io{.iov_base = &regs, .iov_len = sizeof(regs)};
    if (::ptrace(PTRACE_GETREGSET, tracee, reinterpret_cast<void*>(NT_PRSTATUS), &io) != 0) {
        return Error{ErrorCode::Sandbox, "PTRACE_GETREGSET on " + std::to_string(tracee)
                                             + ": " + std::strerror(errno)};
    }

    SyscallRegisters out;
#if defined(__x86_64__)
    out.number = static_cast<long>(regs.orig_rax);
    out.args = {regs.rdi, regs.rsi, regs.rdx, regs.r10, regs.r8, regs.r9};
#elif defined(__aarch64__)
    out.number = static_cast<long>(regs.regs[8]);
    out.args = {regs.regs[0], regs.regs[1], regs.regs[2],
                regs.regs[3], regs.regs[4], regs.regs[5]};
#else
#error "Unsupported architecture: only x86_64 and aarch64 tracees are supported"
#endif
    return out;
}

std::optional<std::string> read_tracee_string(pid_t tracee, uint64_t address, size_t max_length) {
    if (address == 0) return std::string{};

    std::string out;
    char chunk[kPageSize];
    while (out.size() < max_length) {
        // Never cross a page boundary in one read: the next page may be unmapped.
        const uint64_t to_page_end = kPageSize - (address % kPageSize);
        const size_t want = static_cast<size_t>(std::min<uint64_t>(to_page_end, max_length - out.size()));

        iovec local{.iov_base = chunk, .iov_len = want};
        iovec remote{.iov_base = reinterpret_cast<void*>(address), .iov_len = want};
        ssize_t n = ::process_vm_readv(tracee, &local, 1, &remote, 1, 0);
        if (n <= 0) return std::nullopt;

        const auto* nul = static_cast<const char*>(std::memchr(chunk, '\0', static_cast<size_t>(n)));
        if (nul != nullptr) {
            out.append(chunk, static_cast<size_t>(nul - chunk));
            return out;
        }
        out.append(chunk, static_cast<size_t>(n));
        address += static_cast<uint64_t>(n);
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> resolve_tracee_path(pid_t tracee, int dirfd,
                                                         const std::string& path) {
    std::filesystem::path operand{path};
    if (!path.empty() && operand.is_absolute()) return operand;

    const std::string proc = "/proc/" + std::to_string(tracee);
    auto base = dirfd == AT_FDCWD ? read_proc_link(proc + "/cwd")
                                  : read_proc_link(proc + "/fd/" + std::to_string(dirfd));
    if (!base) return std::nullopt;
    if (path.empty()) return base;
    return *base / operand;
}

}  // namespace code_verdict
