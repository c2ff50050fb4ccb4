/**
 * @file batch.hpp
 * @brief Batch input: (task id, candidate code, assertions) triples loaded from TOML.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

struct BatchItem {
    TaskId id;
    std::string code;
    std::vector<std::string> assertions;
};

struct Batch {
    std::string name;
    std::string version;
    std::string description;
    std::vector<BatchItem> items;

    [[nodiscard]] size_t size() const noexcept { return items.size(); }
};

/**
 * @brief Load a batch file.
 *
 * @code
 * [batch]
 * name = "humaneval-subset"
 *
 * [[tasks]]
 * id = "sum"
 * code = "total = sum([1, 2, 3, 4, 5])"
 * assertions = ["total == 15"]      # or: test = """assert total == 15"""
 * @endcode
 *
 * Candidate code goes through clean_code. Empty or duplicate ids are rejected.
 */
[[nodiscard]] Result<Batch> load_batch(const std::filesystem::path& path);

/// Parse batch TOML from memory; @p origin names the source in error messages.
[[nodiscard]] Result<Batch> parse_batch(std::string_view text, std::string_view origin = "batch");

/// Remove markdown code fences (``` plus an optional language tag) from model output.
[[nodiscard]] std::string clean_code(std::string_view text);

/**
 * @brief Split a test script into assertion statements.
 *
 * Each unindented line starts a statement; indented lines are joined to the
 * statement above them. Blank lines and comment lines are dropped.
 */
[[nodiscard]] std::vector<std::string> split_assertions(std::string_view script);

}  // namespace code_verdict
