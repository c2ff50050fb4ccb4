/**
 * @file tracee.hpp
 * @brief Inspection of a ptrace-stopped process: registers, memory, paths.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/result.hpp"

#include <sys/types.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace code_verdict {

/// Syscall number and raw arguments at a seccomp stop.
struct SyscallRegisters {
    long number{-1};
    std::array<uint64_t, 6> args{};
};

[[nodiscard]] Result<SyscallRegisters> read_syscall_registers(pid_t tracee);

/**
 * @brief Read a NUL-terminated string from the tracee's address space.
 *
 * A null @p address yields an empty string (AT_EMPTY_PATH style operands).
 * @return nullopt when the memory is unreadable or no terminator is found
 *         within @p max_length bytes.
 */
[[nodiscard]] std::optional<std::string> read_tracee_string(pid_t tracee, uint64_t address,
                                                            size_t max_length = 4096);

/**
 * @brief Absolute form of a path operand as the tracee would see it.
 *
 * Relative paths are anchored at the tracee's cwd (dirfd == AT_FDCWD) or at the
 * directory @p dirfd refers to. Symlinks are not resolved here.
 */
[[nodiscard]] std::optional<std::filesystem::path> resolve_tracee_path(pid_t tracee, int dirfd,
                                                                       const std::string& path);

}  // namespace code_verdict
