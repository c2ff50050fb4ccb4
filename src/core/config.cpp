/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author CodeVerdict contributors
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/capability_policy.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <system_error>

#include <toml++/toml.hpp>

namespace code_verdict {

namespace {

std::vector<std::string> read_string_array(toml::node_view<toml::node> node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (const auto& element : *arr) {
            if (auto str = element.value<std::string>()) {
                out.push_back(*str);
            }
        }
    }
    return out;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.interpreter = sandbox["interpreter"].value_or(
                config.sandbox.interpreter.string());
            config.sandbox.scratch_root = sandbox["scratch_root"].value_or(
                config.sandbox.scratch_root.string());
            config.sandbox.allow = read_string_array(sandbox["allow"]);
            config.sandbox.deny = read_string_array(sandbox["deny"]);
            config.sandbox.max_file_size_mb = static_cast<uint64_t>(
                sandbox["max_file_size_mb"].value_or(int64_t{16}));
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.cpu_timeout_ms = static_cast<uint32_t>(
                limits["cpu_timeout_ms"].value_or(int64_t{5000}));
            config.limits.wall_timeout_ms = static_cast<uint32_t>(
                limits["wall_timeout_ms"].value_or(int64_t{5000}));
            config.limits.memory_ceiling_mb = static_cast<uint64_t>(
                limits["memory_ceiling_mb"].value_or(int64_t{512}));
            config.limits.output_cap_bytes = static_cast<uint64_t>(
                limits["output_cap_bytes"].value_or(int64_t{65536}));
        }

        // [orchestrator]
        if (auto orchestrator = tbl["orchestrator"]; orchestrator.is_table()) {
            config.orchestrator.workers = static_cast<uint32_t>(
                orchestrator["workers"].value_or(int64_t{0}));
            config.orchestrator.max_task_timeout_ms = static_cast<uint32_t>(
                orchestrator["max_task_timeout_ms"].value_or(int64_t{60000}));
            config.orchestrator.max_attempts = static_cast<uint32_t>(
                orchestrator["max_attempts"].value_or(int64_t{2}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_dir = telemetry["metrics_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate(const Config& config) {
    const auto& limits = config.limits;
    if (limits.cpu_timeout_ms == 0 || limits.wall_timeout_ms == 0) {
        return Error{ErrorCode::Config, "limits: timeouts must be positive"};
    }
    if (limits.memory_ceiling_mb == 0) {
        return Error{ErrorCode::Config, "limits: memory_ceiling_mb must be positive"};
    }
    if (limits.output_cap_bytes == 0) {
        return Error{ErrorCode::Config, "limits: output_cap_bytes must be positive"};
    }
    if (config.orchestrator.max_attempts == 0) {
        return Error{ErrorCode::Config, "orchestrator: max_attempts must be at least 1"};
    }
    if (config.orchestrator.max_task_timeout_ms <= limits.wall_timeout_ms) {
        return Error{ErrorCode::Config,
                     "orchestrator: max_task_timeout_ms must exceed limits.wall_timeout_ms"};
    }
    if (config.sandbox.interpreter.empty() || config.sandbox.scratch_root.empty()) {
        return Error{ErrorCode::Config, "sandbox: interpreter and scratch_root are required"};
    }
    if (auto policy = CapabilityPolicy::from_names(config.sandbox.allow, config.sandbox.deny); !policy) {
        return policy.error();
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "telemetry: unknown log_level '" + config.telemetry.log_level + "'"};
    }
    return {};
}

ResourceLimits to_resource_limits(const LimitsConfig& limits) {
    return ResourceLimits{
        .cpu_timeout = std::chrono::milliseconds{limits.cpu_timeout_ms},
        .wall_timeout = std::chrono::milliseconds{limits.wall_timeout_ms},
        .memory_ceiling_bytes = limits.memory_ceiling_mb * 1024 * 1024,
        .output_cap_bytes = limits.output_cap_bytes
    };
}

Result<std::filesystem::path> find_config_file(const std::filesystem::path& dir,
                                               std::string_view pattern) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::Config, "Cannot read config directory '" + dir.string()
                                            + "': " + ec.message()};
    }

    const std::string glob{pattern};
    std::vector<std::filesystem::path> matches;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        auto name = entry.path().filename().string();
        if (fnmatch(glob.c_str(), name.c_str(), 0) == 0) {
            matches.push_back(entry.path());
        }
    }

    if (matches.empty()) {
        return Error{ErrorCode::Config, "No config file matching pattern '" + glob
                                            + "' found in '" + dir.string() + "'"};
    }
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

}  // namespace code_verdict
