/**
 * @file test_report_protocol.cpp
 * @brief Unit tests for the report channel record codec.
 * @author CodeVerdict contributors
 */

#include "engine/report_protocol.hpp"

#include <gtest/gtest.h>

using namespace code_verdict;

namespace {

constexpr std::string_view kToken = "0123456789abcdef0123456789abcdef";

std::string record(RecordTag tag, std::vector<std::optional<std::string>> fields = {}) {
    return encode_record(kToken, ReportRecord{tag, std::move(fields)});
}

std::string assertion(size_t index, std::string_view status, std::string detail = "",
                      std::optional<std::string> left = std::nullopt,
                      std::optional<std::string> right = std::nullopt) {
    return record(RecordTag::Assertion, {std::to_string(index), std::string{status},
                                         std::move(detail), std::move(left), std::move(right)});
}

}  // namespace

TEST(ReportProtocolTest, EncodeUsesHexFieldsAndDashForAbsent) {
    auto line = encode_record("tok", ReportRecord{RecordTag::Capability, {"network", std::nullopt}});
    EXPECT_EQ(line, "tok\tcapability\t6e6574776f726b\t-\n");
}

TEST(ReportProtocolTest, ParseRecordRoundTrip) {
    ReportRecord original{RecordTag::RuntimeError, {"ZeroDivisionError", "division by zero", "\tline 1"}};
    auto line = encode_record(kToken, original);
    line.pop_back();

    auto parsed = parse_record(line, kToken);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->tag, RecordTag::RuntimeError);
    EXPECT_EQ(parsed->fields, original.fields);
}

TEST(ReportProtocolTest, ParseRejectsWrongToken) {
    auto line = encode_record("forged", ReportRecord{RecordTag::Done, {}});
    line.pop_back();
    auto parsed = parse_record(line, kToken);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::Protocol);
}

TEST(ReportProtocolTest, ParseRejectsUnknownTagAndFieldCount) {
    EXPECT_FALSE(parse_record(std::string{kToken} + "\tbogus", kToken).has_value());
    EXPECT_FALSE(parse_record(std::string{kToken} + "\tdone\t00", kToken).has_value());
    EXPECT_FALSE(parse_record(std::string{kToken} + "\tcompile_error", kToken).has_value());
    EXPECT_FALSE(parse_record(std::string{kToken} + "\tcompile_error\tzz", kToken).has_value());
}

TEST(ReportProtocolTest, DecodeFullSuccessfulRun) {
    std::string channel = record(RecordTag::Ready) + record(RecordTag::Executed)
                        + assertion(0, "passed")
                        + assertion(1, "assertion_failure", "3 == 4 is false", "3", "4")
                        + record(RecordTag::Done);

    auto report = decode_report(channel, kToken);
    EXPECT_TRUE(report.ready);
    EXPECT_TRUE(report.executed);
    EXPECT_TRUE(report.done);
    EXPECT_FALSE(report.tampering.has_value());
    EXPECT_EQ(report.rejected_lines, 0u);
    ASSERT_EQ(report.assertion_reports.size(), 2u);
    EXPECT_EQ(report.assertion_reports[0].index, 0u);
    EXPECT_EQ(report.assertion_reports[0].status, AssertionStatus::Passed);
    EXPECT_EQ(report.assertion_reports[1].index, 1u);
    EXPECT_EQ(report.assertion_reports[1].left, "3");
    EXPECT_EQ(report.assertion_reports[1].right, "4");
}

TEST(ReportProtocolTest, DecodeFirstCapabilityReportWins) {
    std::string channel = record(RecordTag::Ready)
                        + record(RecordTag::Capability, {"environment_access", "os.environ"})
                        + record(RecordTag::Capability, {"network", "second"});

    auto report = decode_report(channel, kToken);
    ASSERT_TRUE(report.violation.has_value());
    EXPECT_EQ(report.violation->capability, Capability::EnvironmentAccess);
    EXPECT_EQ(report.violation->detail, "os.environ");
    EXPECT_FALSE(report.tampering.has_value());
}

TEST(ReportProtocolTest, DecodeFlagsAssertionsBeforeExecuted) {
    // Candidate code writing passing verdicts while it is still executing.
    std::string channel = record(RecordTag::Ready)
                        + assertion(0, "passed")
                        + record(RecordTag::Executed)
                        + assertion(0, "assertion_failure", "1 == 2 is false", "1", "2")
                        + record(RecordTag::Done);

    auto report = decode_report(channel, kToken);
    ASSERT_TRUE(report.tampering.has_value());
    EXPECT_NE(report.tampering->find("before 'executed'"), std::string::npos);
    ASSERT_EQ(report.assertion_reports.size(), 1u);
    EXPECT_EQ(report.assertion_reports[0].status, AssertionStatus::AssertionFailure);
}

TEST(ReportProtocolTest, DecodeFlagsRepeatedOrSkippedIndex) {
    std::string repeated = record(RecordTag::Executed) + assertion(0, "passed") + assertion(0, "passed");
    auto first = decode_report(repeated, kToken);
    ASSERT_TRUE(first.tampering.has_value());
    EXPECT_EQ(first.assertion_reports.size(), 1u);

    std::string skipped = record(RecordTag::Executed) + assertion(1, "passed");
    auto second = decode_report(skipped, kToken);
    ASSERT_TRUE(second.tampering.has_value());
    EXPECT_TRUE(second.assertion_reports.empty());
}

TEST(ReportProtocolTest, DecodeFlagsRecordsAfterDoneAndRepeatedExecuted) {
    std::string after_done = record(RecordTag::Executed) + record(RecordTag::Done)
                           + record(RecordTag::RuntimeError, {"X", "late", ""});
    auto first = decode_report(after_done, kToken);
    ASSERT_TRUE(first.tampering.has_value());
    EXPECT_FALSE(first.runtime_error.has_value());

    std::string twice = record(RecordTag::Executed) + record(RecordTag::Executed);
    auto second = decode_report(twice, kToken);
    ASSERT_TRUE(second.tampering.has_value());
    EXPECT_EQ(*second.tampering, "unexpected 'executed' record");
}

TEST(ReportProtocolTest, DecodeIgnoresForgedAndPartialLines) {
    std::string channel = record(RecordTag::Ready)
                        + "not a record\n"
                        + encode_record("forged", ReportRecord{RecordTag::Done, {}})
                        + record(RecordTag::Executed);
    auto partial = record(RecordTag::Done);
    partial.pop_back();
    channel += partial;

    auto report = decode_report(channel, kToken);
    EXPECT_TRUE(report.ready);
    EXPECT_TRUE(report.executed);
    EXPECT_FALSE(report.done);
    EXPECT_EQ(report.rejected_lines, 2u);
}

TEST(ReportProtocolTest, DecodeFormatsRuntimeError) {
    auto channel = record(RecordTag::RuntimeError,
                          {"ZeroDivisionError", "division by zero",
                           "  File \"<candidate>\", line 1, in <module>\n"});
    auto report = decode_report(channel, kToken);
    ASSERT_TRUE(report.runtime_error.has_value());
    EXPECT_EQ(report.runtime_error->rfind("ZeroDivisionError: division by zero\n", 0), 0u);
    EXPECT_NE(report.runtime_error->find("<candidate>"), std::string::npos);
}

TEST(ReportProtocolTest, DecodeRejectsUnknownCapabilityName) {
    auto report = decode_report(record(RecordTag::Capability, {"telepathy", "x"}), kToken);
    EXPECT_FALSE(report.violation.has_value());
    EXPECT_EQ(report.rejected_lines, 1u);
}
