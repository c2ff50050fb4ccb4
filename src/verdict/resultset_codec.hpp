/**
 * @file resultset_codec.hpp
 * @brief TOML record of a Resultset (toml++), and its file I/O.
 * @author CodeVerdict contributors
 *
 * Layout:
 *   [resultset]    name, version, description
 *   [summary]      total, passed, pass_rate, percentage_passed
 *   [[results]]    one table per task, in input order
 *   [[results.outcomes]]  one table per assertion
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "verdict/resultset.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace code_verdict {

[[nodiscard]] std::string serialize_resultset(const Resultset& resultset);

/**
 * @brief Parse a record produced by serialize_resultset.
 *
 * Rejects (Serialization error) unknown enum names, duplicate task ids and
 * summary counts or pass flags that disagree with the results.
 */
[[nodiscard]] Result<Resultset> deserialize_resultset(std::string_view text);

[[nodiscard]] Result<void> write_resultset(const std::filesystem::path& path,
                                           const Resultset& resultset);
[[nodiscard]] Result<Resultset> read_resultset(const std::filesystem::path& path);

/**
 * @brief `<dir>/<batch_name>_<YYYYmmdd_HHMMSS>.toml`, spaces in the name replaced by '_'.
 */
[[nodiscard]] std::filesystem::path generate_output_path(const std::filesystem::path& dir,
                                                         std::string_view batch_name,
                                                         Timestamp when);

}  // namespace code_verdict
