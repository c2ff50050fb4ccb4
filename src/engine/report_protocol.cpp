/**
 * @file report_protocol.cpp
 * @brief Report channel record codec.
 * @author CodeVerdict contributors
 */

#include "engine/report_protocol.hpp"
#include "core/text.hpp"

#include <array>
#include <charconv>

namespace code_verdict {

namespace {

constexpr std::string_view kAbsent = "-";

struct TagInfo {
    RecordTag tag;
    std::string_view name;
    size_t field_count;
};

constexpr std::array<TagInfo, 7> kTags = {{
    {RecordTag::Ready, "ready", 0},
    {RecordTag::CompileError, "compile_error", 1},
    {RecordTag::Executed, "executed", 0},
    {RecordTag::RuntimeError, "runtime_error", 3},
    {RecordTag::Capability, "capability", 2},
    {RecordTag::Assertion, "assertion", 5},
    {RecordTag::Done, "done", 0},
}};

const TagInfo& info(RecordTag tag) noexcept {
    return kTags[static_cast<size_t>(tag)];
}

std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            parts.push_back(line.substr(start));
            return parts;
        }
        parts.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
}

std::optional<size_t> parse_index(const std::string& text) {
    size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
    return value;
}

/// Joins "Type: message" with the candidate-only traceback.
std::string format_runtime_error(const ReportRecord& record) {
    std::string type = record.fields[0].value_or("Exception");
    std::string message = record.fields[1].value_or("");
    std::string text = message.empty() ? type : type + ": " + message;
    const std::string traceback = record.fields[2].value_or("");
    if (!traceback.empty()) text += "\nTraceback (candidate frames):\n" + traceback;
    return text;
}

}  // namespace

std::string_view to_string(RecordTag tag) noexcept {
    return info(tag).name;
}

std::optional<RecordTag> parse_record_tag(std::string_view name) noexcept {
    for (const auto& entry : kTags) {
        if (entry.name == name) return entry.tag;
    }
    return std::nullopt;
}

std::string encode_record(std::string_view token, const ReportRecord& record) {
    std::string line{token};
    line += '\t';
    line += to_string(record.tag);
    for (const auto& field : record.fields) {
        line += '\t';
        line += field ? hex_encode(*field) : std::string{kAbsent};
    }
    line += '\n';
    return line;
}

Result<ReportRecord> parse_record(std::string_view line, std::string_view token) {
    auto parts = split_tabs(line);
    if (parts.size() < 2) return make_error<ReportRecord>(ErrorCode::Protocol, "record too short");
    if (token.empty() || parts[0] != token) {
        return make_error<ReportRecord>(ErrorCode::Protocol, "session token mismatch");
    }

    auto tag = parse_record_tag(parts[1]);
    if (!tag) {
        return make_error<ReportRecord>(ErrorCode::Protocol,
                                       "unknown record tag '" + std::string{parts[1]} + "'");
    }
    if (parts.size() - 2 != info(*tag).field_count) {
        return make_error<ReportRecord>(ErrorCode::Protocol,
                                       "wrong field count for '" + std::string{parts[1]} + "'");
    }

    ReportRecord record{*tag, {}};
    for (size_t i = 2; i < parts.size(); ++i) {
        if (parts[i] == kAbsent) {
            record.fields.emplace_back(std::nullopt);
            continue;
        }
        auto decoded = hex_decode(parts[i]);
        if (!decoded) {
            return make_error<ReportRecord>(ErrorCode::Protocol, "field is not hex encoded");
        }
        record.fields.emplace_back(sanitize_utf8(*decoded));
    }
    return record;
}

DriverReport decode_report(std::string_view channel, std::string_view token) {
    DriverReport report;
    const auto tampered = [&report](std::string reason) {
        if (!report.tampering) report.tampering = std::move(reason);
    };

    size_t start = 0;
    while (start < channel.size()) {
        const size_t newline = channel.find('\n', start);
        if (newline == std::string_view::npos) break;
        const auto line = channel.substr(start, newline - start);
        start = newline + 1;

        auto parsed = parse_record(line, token);
        if (!parsed) {
            ++report.rejected_lines;
            continue;
        }
        const ReportRecord& record = *parsed;

        if (report.done) {
            tampered("'" + std::string{to_string(record.tag)} + "' record after 'done'");
            continue;
        }

        switch (record.tag) {
            case RecordTag::Ready:
                if (report.ready) tampered("repeated 'ready' record");
                report.ready = true;
                break;
            case RecordTag::Executed:
                if (report.executed || report.compile_error) {
                    tampered("unexpected 'executed' record");
                    break;
                }
                report.executed = true;
                break;
            case RecordTag::Done:
                report.done = true;
                break;
            case RecordTag::CompileError:
                if (report.executed || report.compile_error) {
                    tampered("unexpected 'compile_error' record");
                    break;
                }
                report.compile_error = record.fields[0].value_or("");
                break;
            case RecordTag::RuntimeError:
                if (!report.runtime_error) report.runtime_error = format_runtime_error(record);
                break;
            case RecordTag::Capability: {
                auto capability = parse_capability(record.fields[0].value_or(""));
                if (!capability) {
                    ++report.rejected_lines;
                    break;
                }
                if (!report.violation) {
                    report.violation = Violation{*capability, record.fields[1].value_or("")};
                }
                break;
            }
            case RecordTag::Assertion: {
                auto index = parse_index(record.fields[0].value_or(""));
                auto status = parse_assertion_status(record.fields[1].value_or(""));
                if (!index || !status) {
                    ++report.rejected_lines;
                    break;
                }
                if (!report.executed) {
                    tampered("assertion " + std::to_string(*index) + " reported before 'executed'");
                    break;
                }
                if (*index != report.assertion_reports.size()) {
                    tampered("assertion " + std::to_string(*index) + " reported out of sequence");
                    break;
                }
                report.assertion_reports.push_back(AssertionReport{
                    .index = *index,
                    .status = *status,
                    .detail = record.fields[2].value_or(""),
                    .left = record.fields[3],
                    .right = record.fields[4],
                });
                break;
            }
        }
    }
    return report;
}

}  // namespace code_verdict
