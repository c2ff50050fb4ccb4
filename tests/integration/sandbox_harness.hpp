/**
 * @file sandbox_harness.hpp
 * @brief Shared setup for tests that run real Python inside the isolation boundary.
 * @author CodeVerdict contributors
 *
 * Hosts without /usr/bin/python3, or where ptrace/seccomp are unavailable
 * (some container runtimes), cannot run these tests; fixtures skip there.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "sandbox/capability_policy.hpp"
#include "sandbox/isolation_boundary.hpp"
#include "telemetry/json_sink.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

namespace code_verdict::it {

inline const std::filesystem::path kInterpreter = "/usr/bin/python3";

class SandboxHarness {
public:
    explicit SandboxHarness(CapabilityPolicy policy, const std::string& name)
        : scratch_root_(std::filesystem::temp_directory_path()
                        / ("cv_it_" + name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(scratch_root_);
        if (!std::filesystem::exists(kInterpreter)) {
            unavailable_ = kInterpreter.string() + " not found";
            return;
        }
        auto boundary = IsolationBoundary::create(BoundaryOptions{
            .policy = policy,
            .scratch_root = scratch_root_,
        });
        if (!boundary) {
            unavailable_ = boundary.error().describe();
            return;
        }
        boundary_ = std::move(*boundary);
        engine_ = std::make_unique<ExecutionEngine>(*boundary_, kInterpreter, logger_);

        auto trial = execute("x = 1", {});
        if (!trial) {
            unavailable_ = trial.error().describe();
        } else if (trial->result.terminal != TerminalState::Success) {
            unavailable_ = "trivial program ended as " + std::string{to_string(trial->result.terminal)}
                         + ": " + trial->result.message;
        }
    }

    ~SandboxHarness() {
        std::error_code ec;
        std::filesystem::remove_all(scratch_root_, ec);
    }

    SandboxHarness(const SandboxHarness&) = delete;
    SandboxHarness& operator=(const SandboxHarness&) = delete;

    /// Empty when the sandbox works on this host.
    [[nodiscard]] const std::string& unavailable() const noexcept { return unavailable_; }

    [[nodiscard]] Result<Execution> execute(const std::string& code,
                                            std::vector<std::string> assertions,
                                            ResourceLimits limits = {}) const {
        return engine_->execute(ExecutionRequest{
            .task_id = "it",
            .code = code,
            .assertions = std::move(assertions),
            .limits = limits,
        });
    }

    [[nodiscard]] const ExecutionEngine& engine() const noexcept { return *engine_; }
    [[nodiscard]] const std::filesystem::path& scratch_root() const noexcept { return scratch_root_; }

private:
    std::filesystem::path scratch_root_;
    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<IsolationBoundary> boundary_;
    std::unique_ptr<ExecutionEngine> engine_;
    std::string unavailable_;
};

}  // namespace code_verdict::it
