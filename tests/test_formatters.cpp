#include <gtest/gtest.h>
#include "commands/formatters.hpp"

using namespace lazyverdi::tui;

TEST(FormattersTest, StripsTrailingEcho) {
    EXPECT_EQ(strip_command_echo("line one\nline two\n$ verdi process list"), "line one\nline two");
    EXPECT_EQ(strip_command_echo("line one\n  $ verdi code list  "), "line one");
}

TEST(FormattersTest, KeepsTextWithoutEcho) {
    EXPECT_EQ(strip_command_echo("no echo here\n"), "no echo here\n");
    EXPECT_EQ(strip_command_echo("$ verdi first\nthen text"), "$ verdi first\nthen text");
    EXPECT_EQ(strip_command_echo(""), "");
}

TEST(FormattersTest, TableOutputDropsTrailingBlankLines) {
    std::string text = "  PK  Label\n  --  -----\n  1   a\n\n   \n$ verdi group list\n";
    EXPECT_EQ(format_table_output(text), "  PK  Label\n  --  -----\n  1   a");
}

TEST(FormattersTest, ProcessListKeepsReports) {
    std::string text = "PK  State\n--  -----\n\nTotal results: 0\n\nReport: daemon not running\n\n";
    EXPECT_EQ(format_process_list(text),
              "PK  State\n--  -----\n\nTotal results: 0\n\nReport: daemon not running");
}

TEST(FormattersTest, StatusOutputIsTrimmed) {
    EXPECT_EQ(format_status_output("\n  Profile: default  \n$ verdi daemon status\n"), "Profile: default");
}

TEST(FormattersTest, NoFormatIsIdentity) {
    EXPECT_EQ(no_format("  as is \n"), "  as is \n");
}
