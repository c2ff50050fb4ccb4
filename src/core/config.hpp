/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author CodeVerdict contributors
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace code_verdict {

struct SandboxConfig {
    std::filesystem::path interpreter = "/usr/bin/python3";
    std::filesystem::path scratch_root = "/tmp/code_verdict";
    std::vector<std::string> allow;         ///< Capability names granted
    std::vector<std::string> deny;          ///< Explicit denials, win over allow
    uint64_t max_file_size_mb = 16;         ///< RLIMIT_FSIZE for scratch writes
};

struct LimitsConfig {
    uint32_t cpu_timeout_ms = 5000;
    uint32_t wall_timeout_ms = 5000;
    uint64_t memory_ceiling_mb = 512;
    uint64_t output_cap_bytes = 65536;
};

struct OrchestratorConfig {
    uint32_t workers = 0;                   ///< 0 = hardware_concurrency
    uint32_t max_task_timeout_ms = 60000;   ///< Host-level bound, above the wall timeout
    uint32_t max_attempts = 2;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    std::string log_level = "info";
    std::filesystem::path metrics_dir;      ///< Empty = metrics discarded
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SandboxConfig sandbox;
    LimitsConfig limits;
    OrchestratorConfig orchestrator;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field constraints (positive limits, known names, timeout ordering).
 */
Result<void> validate(const Config& config);

/**
 * @brief Per-execution limits derived from the [limits] section.
 */
ResourceLimits to_resource_limits(const LimitsConfig& limits);

/**
 * @brief First file in @p dir (lexicographic order) whose name matches the glob @p pattern.
 */
Result<std::filesystem::path> find_config_file(const std::filesystem::path& dir,
                                               std::string_view pattern);

}  // namespace code_verdict
