/**
 * @file resultset_codec.cpp
 * @brief Resultset serialization using toml++.
 * @author CodeVerdict contributors
 */

#include "verdict/resultset_codec.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include <toml++/toml.hpp>

namespace code_verdict {

namespace {

// ── Encoding ─────────────────────────────────

toml::table encode_outcome(const AssertionOutcome& outcome) {
    toml::table table{
        {"assertion", outcome.assertion},
        {"status", std::string{to_string(outcome.status)}},
        {"detail", outcome.detail},
    };
    if (outcome.left) table.insert_or_assign("left", *outcome.left);
    if (outcome.right) table.insert_or_assign("right", *outcome.right);
    return table;
}

toml::table encode_result(const TaskResult& result) {
    const auto& execution = result.execution;
    toml::table table{
        {"task_id", result.task_id},
        {"terminal", std::string{to_string(execution.terminal)}},
        {"passed", result.passed},
        {"attempts", static_cast<int64_t>(result.attempts)},
        {"message", execution.message},
        {"stdout", execution.stdout_text},
        {"stdout_truncated", execution.stdout_truncated},
        {"stderr", execution.stderr_text},
        {"stderr_truncated", execution.stderr_truncated},
        {"wall_time_us", static_cast<int64_t>(execution.wall_time.count())},
        {"peak_memory_bytes", static_cast<int64_t>(execution.peak_memory_bytes)},
    };
    if (execution.violated_capability) {
        table.insert_or_assign("violated_capability",
                               std::string{to_string(*execution.violated_capability)});
    }

    toml::array outcomes;
    for (const auto& outcome : result.outcomes) outcomes.push_back(encode_outcome(outcome));
    table.insert_or_assign("outcomes", std::move(outcomes));
    return table;
}

// ── Decoding ─────────────────────────────────

template <typename T>
Result<T> required(const toml::table& table, std::string_view key, const std::string& context) {
    if (auto value = table[key].value<T>()) return *value;
    return Error{ErrorCode::Serialization,
                 context + ": missing or invalid '" + std::string{key} + "'"};
}

std::optional<std::string> optional_string(const toml::table& table, std::string_view key) {
    return table[key].value<std::string>();
}

Result<AssertionOutcome> decode_outcome(const toml::table& table, const std::string& context) {
    auto assertion = required<std::string>(table, "assertion", context);
    if (!assertion) return assertion.error();
    auto status_name = required<std::string>(table, "status", context);
    if (!status_name) return status_name.error();
    auto status = parse_assertion_status(*status_name);
    if (!status) {
        return Error{ErrorCode::Serialization, context + ": unknown status '" + *status_name + "'"};
    }

    AssertionOutcome outcome;
    outcome.assertion = std::move(*assertion);
    outcome.status = *status;
    outcome.detail = table["detail"].value_or(std::string{});
    outcome.left = optional_string(table, "left");
    outcome.right = optional_string(table, "right");
    return outcome;
}

Result<TaskResult> decode_result(const toml::table& table, const std::string& context) {
    auto task_id = required<std::string>(table, "task_id", context);
    if (!task_id) return task_id.error();
    auto terminal_name = required<std::string>(table, "terminal", context);
    if (!terminal_name) return terminal_name.error();
    auto terminal = parse_terminal_state(*terminal_name);
    if (!terminal) {
        return Error{ErrorCode::Serialization,
                     context + ": unknown terminal state '" + *terminal_name + "'"};
    }
    auto passed = required<bool>(table, "passed", context);
    if (!passed) return passed.error();

    TaskResult result;
    result.task_id = std::move(*task_id);
    result.passed = *passed;
    result.attempts = static_cast<uint32_t>(table["attempts"].value_or(int64_t{1}));

    auto& execution = result.execution;
    execution.terminal = *terminal;
    execution.message = table["message"].value_or(std::string{});
    execution.stdout_text = table["stdout"].value_or(std::string{});
    execution.stdout_truncated = table["stdout_truncated"].value_or(false);
    execution.stderr_text = table["stderr"].value_or(std::string{});
    execution.stderr_truncated = table["stderr_truncated"].value_or(false);
    execution.wall_time = Duration{table["wall_time_us"].value_or(int64_t{0})};
    execution.peak_memory_bytes = static_cast<uint64_t>(table["peak_memory_bytes"].value_or(int64_t{0}));

    if (auto name = optional_string(table, "violated_capability")) {
        auto capability = parse_capability(*name);
        if (!capability) {
            return Error{ErrorCode::Serialization, context + ": unknown capability '" + *name + "'"};
        }
        execution.violated_capability = *capability;
    }

    if (auto* outcomes = table["outcomes"].as_array()) {
        size_t index = 0;
        for (const auto& node : *outcomes) {
            const std::string where = context + ".outcomes[" + std::to_string(index++) + "]";
            const auto* outcome_table = node.as_table();
            if (outcome_table == nullptr) {
                return Error{ErrorCode::Serialization, where + ": expected a table"};
            }
            auto outcome = decode_outcome(*outcome_table, where);
            if (!outcome) return outcome.error();
            result.outcomes.push_back(std::move(*outcome));
        }
    }

    if (result.passed != compute_passed(result.execution, result.outcomes)) {
        return Error{ErrorCode::Serialization, context + ": 'passed' disagrees with the outcomes"};
    }
    return result;
}

}  // namespace

std::string serialize_resultset(const Resultset& resultset) {
    toml::table root;
    root.insert_or_assign("resultset", toml::table{
        {"name", resultset.name},
        {"version", resultset.version},
        {"description", resultset.description},
    });
    root.insert_or_assign("summary", toml::table{
        {"total", static_cast<int64_t>(resultset.size())},
        {"passed", static_cast<int64_t>(resultset.number_passed())},
        {"pass_rate", resultset.pass_rate()},
        {"percentage_passed", resultset.percentage_passed()},
    });

    toml::array results;
    for (const auto& result : resultset.results) results.push_back(encode_result(result));
    root.insert_or_assign("results", std::move(results));

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

Result<Resultset> deserialize_resultset(std::string_view text) {
    toml::table root;
    try {
        root = toml::parse(text);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Serialization,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    const auto* header = root["resultset"].as_table();
    if (header == nullptr) return Error{ErrorCode::Serialization, "missing [resultset] table"};

    Resultset resultset;
    resultset.name = (*header)["name"].value_or(std::string{});
    resultset.version = (*header)["version"].value_or(std::string{});
    resultset.description = (*header)["description"].value_or(std::string{});

    if (auto* results = root["results"].as_array()) {
        std::unordered_set<std::string> seen;
        size_t index = 0;
        for (const auto& node : *results) {
            const std::string context = "results[" + std::to_string(index++) + "]";
            const auto* table = node.as_table();
            if (table == nullptr) return Error{ErrorCode::Serialization, context + ": expected a table"};
            auto result = decode_result(*table, context);
            if (!result) return result.error();
            if (!seen.insert(result->task_id).second) {
                return Error{ErrorCode::Serialization, context + ": duplicate task_id '"
                                                           + result->task_id + "'"};
            }
            resultset.results.push_back(std::move(*result));
        }
    }

    if (const auto* summary = root["summary"].as_table()) {
        const auto total = (*summary)["total"].value<int64_t>();
        const auto passed = (*summary)["passed"].value<int64_t>();
        if (!total || !passed
            || static_cast<size_t>(*total) != resultset.size()
            || static_cast<size_t>(*passed) != resultset.number_passed()) {
            return Error{ErrorCode::Serialization, "[summary] counts disagree with the results"};
        }
    }
    return resultset;
}

Result<void> write_resultset(const std::filesystem::path& path, const Resultset& resultset) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create directory '" + path.parent_path().string()
                                            + "': " + ec.message()};
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::Io, "Cannot open '" + path.string() + "' for writing"};
    out << serialize_resultset(resultset);
    out.flush();
    if (!out) return Error{ErrorCode::Io, "Failed writing '" + path.string() + "'"};
    return {};
}

Result<Resultset> read_resultset(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::Io, "Cannot open '" + path.string() + "'"};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return deserialize_resultset(buffer.str());
}

std::filesystem::path generate_output_path(const std::filesystem::path& dir,
                                           std::string_view batch_name,
                                           Timestamp when) {
    std::string safe_name{batch_name};
    for (auto& c : safe_name) {
        if (c == ' ' || c == '/') c = '_';
    }
    if (safe_name.empty()) safe_name = "batch";

    const auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream name;
    name << safe_name << '_' << std::put_time(&local, "%Y%m%d_%H%M%S") << ".toml";
    return dir / name.str();
}

}  // namespace code_verdict
