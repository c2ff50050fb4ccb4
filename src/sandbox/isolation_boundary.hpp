/**
 * @file isolation_boundary.hpp
 * @brief Contained execution of an untrusted process under a CapabilityPolicy.
 * @author CodeVerdict contributors
 *
 * Each run() forks a child that enters a fresh scratch directory, applies
 * resource limits, installs the seccomp program and execs the launch target
 * while the calling thread supervises it through ptrace. Any attempted use of
 * a denied capability kills the whole process tree and is reported as a
 * Violation; it never takes effect.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/capability_policy.hpp"
#include "sandbox/scratch_environment.hpp"
#include "sandbox/syscall_filter.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace code_verdict {

struct BoundaryOptions {
    CapabilityPolicy policy;
    std::filesystem::path scratch_root;
    uint64_t max_file_size_bytes{16ULL * 1024 * 1024};
    uint64_t channel_cap_bytes{8ULL * 1024 * 1024};
};

/// Program started inside the boundary. argv[0] is passed as given.
struct LaunchSpec {
    std::filesystem::path executable;
    std::vector<std::string> argv;
    std::vector<std::string> env;   ///< "KEY=VALUE" entries; nothing else is inherited
};

/// Attempted use of a denied capability.
struct Violation {
    Capability capability;
    std::string detail;
};

struct CapturedStream {
    std::string text;       ///< Valid UTF-8, truncation marker appended when cut
    bool truncated{false};
};

/// Everything observed about one contained run.
struct SandboxOutcome {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool timed_out{false};
    bool cpu_limit_exceeded{false};
    std::optional<Violation> violation;
    CapturedStream stdout_stream;
    CapturedStream stderr_stream;
    std::string channel;    ///< Raw bytes written to the report channel (fd 3)
    Duration wall_time{0};
    uint64_t peak_memory_bytes{0};
};

class IsolationBoundary {
public:
    /// Compiles the syscall filter for @p options.policy.
    static Result<std::unique_ptr<IsolationBoundary>> create(BoundaryOptions options);

    [[nodiscard]] const BoundaryOptions& options() const noexcept { return options_; }
    [[nodiscard]] const CapabilityPolicy& policy() const noexcept { return options_.policy; }

    /// Fresh private scratch directory under the configured root.
    [[nodiscard]] Result<ScratchEnvironment> provision() const;

    /**
     * @brief Run @p launch inside @p scratch until it exits or a limit fires.
     *
     * The calling thread becomes the ptrace supervisor; concurrent calls from
     * different threads are independent. A stop request on @p stop kills the
     * process tree and yields a Cancelled error.
     *
     * @return the outcome, or an Error for host-side failures (fork, pipes,
     *         an executable that cannot be started).
     */
    [[nodiscard]] Result<SandboxOutcome> run(const ScratchEnvironment& scratch,
                                             const LaunchSpec& launch,
                                             const ResourceLimits& limits,
                                             std::stop_token stop = {}) const;

private:
    IsolationBoundary(BoundaryOptions options, SyscallFilter filter)
        : options_(std::move(options)), filter_(std::move(filter)) {}

    BoundaryOptions options_;
    SyscallFilter filter_;
};

}  // namespace code_verdict
