#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/cuid_errors.hpp"

namespace {

using cuid::app::cli::parse_and_validate;
using cuid::core::errors::ErrorCategory;
using cuid::core::errors::get_error;
using cuid::core::errors::get_value;
using cuid::core::errors::is_error;
using cuid::protocol::CliRequest;
using cuid::protocol::Command;
using cuid::protocol::OutputFormat;

cuid::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("cuid");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, RecognizesHelp) {
    auto result = parse_tokens({"--help"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Help);
}

TEST(CliParserTest, GenerateDefaults) {
    auto result = parse_tokens({"generate"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Generate);
    EXPECT_EQ(req.count, 1u);
    EXPECT_EQ(req.format, OutputFormat::Text);
    EXPECT_FALSE(req.cuid.has_value());
    EXPECT_FALSE(req.verbose);
}

TEST(CliParserTest, ParsesValidGenerateRequest) {
    auto result = parse_tokens({"generate", "--count", "42", "--format", "json", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.count, 42u);
    EXPECT_EQ(req.format, OutputFormat::Json);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, FailsWhenCountMissingValue) {
    auto result = parse_tokens({"generate", "--count"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenCountNotNumeric) {
    auto result = parse_tokens({"generate", "--count", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenCountHasTrailingCharacters) {
    auto result = parse_tokens({"generate", "--count", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenCountOutOfBounds) {
    auto zero = parse_tokens({"generate", "--count", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_tokens({"generate", "--count", "1000001"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenFormatUnknown) {
    auto result = parse_tokens({"generate", "--format", "xml"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_format");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"generate", "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, GenerateRejectsPositionalArgument) {
    auto result = parse_tokens({"generate", "extra"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, ParsesInspectRequest) {
    auto result = parse_tokens({"inspect", "cjld2cjxh0000qzrmn831i7rn"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Inspect);
    ASSERT_TRUE(req.cuid.has_value());
    EXPECT_EQ(req.cuid.value(), "cjld2cjxh0000qzrmn831i7rn");
    EXPECT_EQ(req.format, OutputFormat::Json);
}

TEST(CliParserTest, InspectRequiresExactlyOneIdentifier) {
    auto none = parse_tokens({"inspect"});
    ASSERT_TRUE(is_error(none));
    EXPECT_EQ(get_error(none).code, "missing_required_argument");

    auto two = parse_tokens({"inspect", "ca", "cb"});
    ASSERT_TRUE(is_error(two));
    EXPECT_EQ(get_error(two).code, "missing_required_argument");
}

TEST(CliParserTest, InspectRejectsGenerateFlags) {
    auto result = parse_tokens({"inspect", "cjld2cjxh0000qzrmn831i7rn", "--count", "2"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

}  // namespace
