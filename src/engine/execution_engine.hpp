/**
 * @file execution_engine.hpp
 * @brief Runs one code artifact inside the isolation boundary and classifies the outcome.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/execution.hpp"
#include "engine/report_protocol.hpp"
#include "sandbox/isolation_boundary.hpp"

#include <filesystem>
#include <stop_token>

namespace code_verdict {

class ExecutionEngine {
public:
    ExecutionEngine(const IsolationBoundary& boundary,
                    std::filesystem::path interpreter,
                    Logger& logger);

    /**
     * @brief Execute @p request in a freshly provisioned scratch directory.
     *
     * Every outcome of the candidate itself (including crashes, violations and
     * timeouts) is a successful Result. Errors are host-level failures only:
     * provisioning, fork, a missing interpreter, or cancellation via @p stop.
     */
    [[nodiscard]] Result<Execution> execute(const ExecutionRequest& request,
                                            std::stop_token stop = {}) const;

    /**
     * @brief Interpreter command line and environment for a run inside @p scratch_dir.
     *
     * When the policy denies environment_access the environment carries
     * nothing but the hash seed; HOME and TMPDIR are then supplied to the
     * candidate by the driver's guarded os.environ instead.
     */
    [[nodiscard]] LaunchSpec launch_spec(const std::filesystem::path& scratch_dir) const;

    /**
     * @brief Terminal state from what the supervisor saw and the driver reported.
     *
     * Precedence: supervisor violation, driver violation, wall or CPU limit,
     * report tampering, compile error, runtime error, success. A run without any verdict is a
     * RuntimeError naming the exit status or signal.
     */
    [[nodiscard]] static ExecutionResult classify(const SandboxOutcome& outcome,
                                                  const DriverReport& report,
                                                  const ResourceLimits& limits);

private:
    /// Remove @p scratch now, logging anything left behind.
    void release(ScratchEnvironment& scratch, const TaskId& task_id) const;

    const IsolationBoundary& boundary_;
    std::filesystem::path interpreter_;
    Logger& logger_;
};

}  // namespace code_verdict
