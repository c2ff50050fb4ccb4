/**
 * @file test_classify.cpp
 * @brief Unit tests for ExecutionEngine::classify precedence.
 * @author CodeVerdict contributors
 */

#include "engine/execution_engine.hpp"

#include <gtest/gtest.h>
#include <signal.h>

using namespace code_verdict;

namespace {

SandboxOutcome exited(int code) {
    SandboxOutcome outcome;
    outcome.exit_code = code;
    outcome.wall_time = Duration{1500};
    outcome.peak_memory_bytes = 4096;
    return outcome;
}

DriverReport completed() {
    DriverReport report;
    report.ready = true;
    report.executed = true;
    report.done = true;
    return report;
}

ResourceLimits limits() {
    ResourceLimits l;
    l.wall_timeout = std::chrono::milliseconds{2000};
    l.cpu_timeout = std::chrono::milliseconds{1000};
    return l;
}

}  // namespace

TEST(ClassifyTest, SuccessCopiesStreamsAndMeasurements) {
    auto outcome = exited(0);
    outcome.stdout_stream = CapturedStream{"hi\n", false};
    outcome.stderr_stream = CapturedStream{"warn", true};

    auto result = ExecutionEngine::classify(outcome, completed(), limits());
    EXPECT_EQ(result.terminal, TerminalState::Success);
    EXPECT_TRUE(result.message.empty());
    EXPECT_EQ(result.stdout_text, "hi\n");
    EXPECT_TRUE(result.stderr_truncated);
    EXPECT_EQ(result.wall_time, Duration{1500});
    EXPECT_EQ(result.peak_memory_bytes, 4096u);
}

TEST(ClassifyTest, SupervisorViolationBeatsEverything) {
    auto outcome = exited(0);
    outcome.violation = Violation{Capability::ProcessSpawn, "execve(/bin/ls)"};
    outcome.timed_out = true;
    auto report = completed();
    report.violation = Violation{Capability::EnvironmentAccess, "os.environ"};
    report.runtime_error = "X";

    auto result = ExecutionEngine::classify(outcome, report, limits());
    EXPECT_EQ(result.terminal, TerminalState::CapabilityViolation);
    EXPECT_EQ(result.violated_capability, Capability::ProcessSpawn);
    EXPECT_NE(result.message.find("process_spawn"), std::string::npos);
}

TEST(ClassifyTest, DriverViolationBeatsTimeout) {
    auto outcome = exited(0);
    outcome.timed_out = true;
    DriverReport report;
    report.violation = Violation{Capability::EnvironmentAccess, "os.getenv('HOME')"};

    auto result = ExecutionEngine::classify(outcome, report, limits());
    EXPECT_EQ(result.terminal, TerminalState::CapabilityViolation);
    EXPECT_EQ(result.violated_capability, Capability::EnvironmentAccess);
}

TEST(ClassifyTest, WallTimeout) {
    SandboxOutcome outcome;
    outcome.term_signal = SIGKILL;
    outcome.timed_out = true;

    auto result = ExecutionEngine::classify(outcome, DriverReport{}, limits());
    EXPECT_EQ(result.terminal, TerminalState::Timeout);
    EXPECT_EQ(result.message, "wall-clock limit of 2000 ms exceeded");
    EXPECT_FALSE(result.violated_capability.has_value());
}

TEST(ClassifyTest, CpuTimeout) {
    SandboxOutcome outcome;
    outcome.term_signal = SIGXCPU;
    outcome.cpu_limit_exceeded = true;

    auto result = ExecutionEngine::classify(outcome, DriverReport{}, limits());
    EXPECT_EQ(result.terminal, TerminalState::Timeout);
    EXPECT_EQ(result.message, "CPU time limit of 1000 ms exceeded");
}

TEST(ClassifyTest, CompileErrorBeatsRuntimeError) {
    DriverReport report;
    report.ready = true;
    report.done = true;
    report.compile_error = "invalid syntax (line 1)";
    report.runtime_error = "unreachable";

    auto result = ExecutionEngine::classify(exited(0), report, limits());
    EXPECT_EQ(result.terminal, TerminalState::CompileError);
    EXPECT_EQ(result.message, "invalid syntax (line 1)");
}

TEST(ClassifyTest, TamperedReportIsRuntimeErrorEvenWhenComplete) {
    DriverReport report = completed();
    report.tampering = "assertion 0 reported before 'executed'";

    auto result = ExecutionEngine::classify(exited(0), report, limits());
    EXPECT_EQ(result.terminal, TerminalState::RuntimeError);
    EXPECT_EQ(result.message, "report channel tampering: assertion 0 reported before 'executed'");
}

TEST(ClassifyTest, RuntimeErrorFromDriver) {
    DriverReport report;
    report.ready = true;
    report.done = true;
    report.runtime_error = "ZeroDivisionError: division by zero";

    auto result = ExecutionEngine::classify(exited(0), report, limits());
    EXPECT_EQ(result.terminal, TerminalState::RuntimeError);
    EXPECT_EQ(result.message, "ZeroDivisionError: division by zero");
}

TEST(ClassifyTest, CrashDuringAssertionsIncludesStderrTail) {
    SandboxOutcome outcome;
    outcome.term_signal = SIGSEGV;
    outcome.stderr_stream = CapturedStream{"Fatal Python error: Segmentation fault\n", false};
    DriverReport report;
    report.ready = true;
    report.executed = true;

    auto result = ExecutionEngine::classify(outcome, report, limits());
    EXPECT_EQ(result.terminal, TerminalState::RuntimeError);
    EXPECT_NE(result.message.find("SIGSEGV"), std::string::npos);
    EXPECT_NE(result.message.find("during assertion evaluation"), std::string::npos);
    EXPECT_NE(result.message.find("Segmentation fault"), std::string::npos);
}

TEST(ClassifyTest, InterpreterFailedBeforeDriverStarted) {
    auto result = ExecutionEngine::classify(exited(1), DriverReport{}, limits());
    EXPECT_EQ(result.terminal, TerminalState::RuntimeError);
    EXPECT_EQ(result.message, "interpreter exited with status 1 before the driver started");
}
