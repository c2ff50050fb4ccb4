/**
 * @file text.hpp
 * @brief Small text utilities shared by the logger, the report channel and the codecs.
 * @author CodeVerdict contributors
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace code_verdict {

/// Escape @p text for inclusion inside a JSON string literal (no surrounding quotes).
[[nodiscard]] std::string json_escape(std::string_view text);

/// Lowercase hexadecimal encoding of raw bytes.
[[nodiscard]] std::string hex_encode(std::string_view bytes);

/// Inverse of hex_encode; nullopt on odd length or a non-hex digit.
[[nodiscard]] std::optional<std::string> hex_decode(std::string_view hex);

/**
 * @brief Replace invalid UTF-8 sequences and NUL bytes with U+FFFD.
 *
 * Captured output of untrusted code is arbitrary bytes; everything stored in a
 * TaskResult goes through here so that the Resultset record stays valid text.
 */
[[nodiscard]] std::string sanitize_utf8(std::string_view bytes);

/// Length of the longest prefix of @p bytes (at most @p limit) that does not split a UTF-8 sequence.
[[nodiscard]] size_t utf8_safe_prefix(std::string_view bytes, size_t limit) noexcept;

/// Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace code_verdict
