//
// Created by gregorian-rayne on 1/25/26.
//

#include "sdkir/cli/commands/command.hpp"
#include "sdkir/cli/formatter.hpp"

#include <gtest/gtest.h>

namespace sdkir::cli
{
    namespace {
        std::vector<ArgDef> analyze_like_args() {
            return {
                {"output", 'o', "Output file", false, true, "", "FILE"},
                {"indent", 0, "Indentation", false, true, "2", "N"},
                {"external-only", 'e', "Only external references", false, false, "", ""}
            };
        }
    }

    // ========================================================================
    // ParsedArgs
    // ========================================================================

    TEST(ParsedArgsTest, ValuesAndFlags) {
        ParsedArgs args;
        args.set("output", "ir.json");
        args.set_flag("json");

        EXPECT_TRUE(args.has("output"));
        EXPECT_TRUE(args.has("json"));
        EXPECT_FALSE(args.has("missing"));
        EXPECT_EQ(args.get("output"), "ir.json");
        EXPECT_EQ(args.get_or("missing", "fallback"), "fallback");
        EXPECT_TRUE(args.get_flag("json"));
        EXPECT_FALSE(args.get_flag("output"));
    }

    TEST(ParsedArgsTest, GetInt) {
        ParsedArgs args;
        args.set("indent", "4");
        args.set("bad", "4x");
        args.set("word", "four");

        EXPECT_EQ(args.get_int("indent"), 4);
        EXPECT_FALSE(args.get_int("bad").has_value());
        EXPECT_FALSE(args.get_int("word").has_value());
        EXPECT_FALSE(args.get_int("missing").has_value());
    }

    // ========================================================================
    // parse_arguments
    // ========================================================================

    TEST(ParseArgumentsTest, PositionalsAndLongOptions) {
        const auto result = parse_arguments({"spec.yaml", "--output", "ir.json"}, analyze_like_args());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"spec.yaml"}));
        EXPECT_EQ(result.args.get("output"), "ir.json");
    }

    TEST(ParseArgumentsTest, EqualsSyntax) {
        const auto result = parse_arguments({"--indent=4"}, analyze_like_args());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get_int("indent"), 4);
    }

    TEST(ParseArgumentsTest, DefaultsApplied) {
        const auto result = parse_arguments({}, analyze_like_args());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get("indent"), "2");
        EXPECT_FALSE(result.args.has("output"));
    }

    TEST(ParseArgumentsTest, ShortOptions) {
        const auto attached = parse_arguments({"-oir.json"}, analyze_like_args());
        ASSERT_TRUE(attached.success);
        EXPECT_EQ(attached.args.get("output"), "ir.json");

        const auto separate = parse_arguments({"-e", "-o", "ir.json"}, analyze_like_args());
        ASSERT_TRUE(separate.success);
        EXPECT_TRUE(separate.args.get_flag("external-only"));
        EXPECT_EQ(separate.args.get("output"), "ir.json");
    }

    TEST(ParseArgumentsTest, CommonFlags) {
        const auto result = parse_arguments({"--json", "-qv", "--debug"}, analyze_like_args());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("quiet"));
        EXPECT_TRUE(result.args.get_flag("verbose"));
        EXPECT_TRUE(result.args.get_flag("debug"));
    }

    TEST(ParseArgumentsTest, DashIsPositional) {
        const auto result = parse_arguments({"-", "--", "--not-an-option"}, analyze_like_args());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"-", "--not-an-option"}));
    }

    TEST(ParseArgumentsTest, UnknownOption) {
        const auto long_opt = parse_arguments({"--frobnicate"}, analyze_like_args());
        EXPECT_FALSE(long_opt.success);
        EXPECT_EQ(long_opt.error, "Unknown option: --frobnicate");

        const auto short_opt = parse_arguments({"-z"}, analyze_like_args());
        EXPECT_FALSE(short_opt.success);
        EXPECT_EQ(short_opt.error, "Unknown option: -z");
    }

    TEST(ParseArgumentsTest, MissingValue) {
        const auto result = parse_arguments({"--output"}, analyze_like_args());

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, "Option --output requires a value");
    }

    // ========================================================================
    // Formatter
    // ========================================================================

    class TableTest : public ::testing::Test {
    protected:
        void SetUp() override {
            colors::set_enabled(false);
        }

        void TearDown() override {
            colors::set_enabled(true);
        }
    };

    TEST_F(TableTest, RendersAlignedColumns) {
        Table table({{"Name", 0, false, std::nullopt}, {"Ops", 0, true, std::nullopt}});
        table.add_row({"users", "3"});
        table.add_row({"ab", "12"});

        EXPECT_EQ(table.render(),
                  "Name   Ops\n"
                  "----------\n"
                  "users    3\n"
                  "ab      12\n");
    }

    TEST_F(TableTest, TruncatesToFixedWidth) {
        Table table({{"Path", 6, false, std::nullopt}});
        table.add_row({"/users/{id}"});

        EXPECT_EQ(table.render(),
                  "Path  \n"
                  "------\n"
                  "/us...\n");
    }

    TEST_F(TableTest, SeparatorAndClear) {
        Table table({{"A", 0, false, std::nullopt}});
        EXPECT_TRUE(table.empty());

        table.add_row({"x"});
        table.add_separator();
        table.add_row({"y"});

        EXPECT_EQ(table.render(), "A\n-\nx\n-\ny\n");

        table.clear();
        EXPECT_TRUE(table.empty());
    }

    TEST(FormatterTest, FormatCount) {
        EXPECT_EQ(format_count(0), "0");
        EXPECT_EQ(format_count(999), "999");
        EXPECT_EQ(format_count(1000), "1,000");
        EXPECT_EQ(format_count(1234567), "1,234,567");
    }

}
