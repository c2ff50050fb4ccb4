/**
 * @file report_protocol.hpp
 * @brief Records the in-interpreter driver writes to the report channel.
 * @author CodeVerdict contributors
 *
 * One record per line: `<token>\t<tag>[\t<field>...]\n`. Every field is the
 * lowercase hex encoding of its UTF-8 bytes, except that "-" marks an absent
 * optional field. Lines without the session token, with an unknown tag or
 * with the wrong field count are discarded.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/isolation_boundary.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

enum class RecordTag : uint8_t {
    Ready,          ///< Driver started and read its request
    CompileError,   ///< message
    Executed,       ///< Candidate ran to completion
    RuntimeError,   ///< type, message, traceback
    Capability,     ///< capability name, detail
    Assertion,      ///< index, status, detail, left|-, right|-
    Done            ///< Driver finished cleanly
};

[[nodiscard]] std::string_view to_string(RecordTag tag) noexcept;
[[nodiscard]] std::optional<RecordTag> parse_record_tag(std::string_view name) noexcept;

struct ReportRecord {
    RecordTag tag;
    std::vector<std::optional<std::string>> fields;
};

/// Raw outcome of one assertion as evaluated inside the interpreter.
struct AssertionReport {
    size_t index{0};
    AssertionStatus status{AssertionStatus::EvaluationError};
    std::string detail;
    std::optional<std::string> left;
    std::optional<std::string> right;

    bool operator==(const AssertionReport&) const = default;
};

/// Everything trustworthy the driver reported for one execution.
struct DriverReport {
    bool ready{false};
    bool executed{false};
    bool done{false};
    std::optional<std::string> compile_error;
    std::optional<std::string> runtime_error;
    std::optional<Violation> violation;
    std::vector<AssertionReport> assertion_reports;   ///< In index order, one per index at most
    std::optional<std::string> tampering; ///< First out-of-sequence record, if any
    size_t rejected_lines{0};
};

/// Encode one record line (with trailing newline).
[[nodiscard]] std::string encode_record(std::string_view token, const ReportRecord& record);

/// Parse one line (without newline). Protocol error when it is not a valid record for @p token.
[[nodiscard]] Result<ReportRecord> parse_record(std::string_view line, std::string_view token);

/**
 * @brief Fold every valid record of @p channel into a DriverReport.
 *
 * Records must follow the driver's sequence: `ready` once, then either a
 * compile error or `executed`, then assertion records with consecutive
 * indices starting at 0, then `done`. A record out of that sequence (an
 * assertion before `executed`, a repeated index, a second `executed` or
 * anything after `done`) is not folded in and sets `tampering`. Runtime
 * errors and capability reports may appear at any point before `done`;
 * the first of each wins. A trailing line without newline (cut off by a
 * kill) is ignored.
 */
[[nodiscard]] DriverReport decode_report(std::string_view channel, std::string_view token);

}  // namespace code_verdict
