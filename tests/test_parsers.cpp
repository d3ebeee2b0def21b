#include <gtest/gtest.h>
#include "commands/parsers.hpp"

using namespace lazyverdi::tui;

TEST(ParsersTest, SplitColumnsOnWideGaps) {
    auto cells = split_columns("  Full label      Pk  Entry point  ");
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0], "Full label");
    EXPECT_EQ(cells[1], "Pk");
    EXPECT_EQ(cells[2], "Entry point");
}

TEST(ParsersTest, SplitColumnsTreatsTabsAsGaps) {
    auto cells = split_columns("a\t\tb");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[1], "b");
}

TEST(ParsersTest, FitRowPadsAndTruncates) {
    EXPECT_EQ(fit_row({"a"}, 3), (std::vector<std::string>{"a", "", ""}));
    EXPECT_EQ(fit_row({"a", "b", "c"}, 2), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(fit_row({"a"}, 0).empty());
}

TEST(ParsersTest, CodeListWithReportFooter) {
    std::string text =
        "Full label      Pk  Entry point\n"
        "------------  ----  -------------------\n"
        "dspaw@nm         1  core.code.installed\n"
        "\n"
        "Report: see docs\n";

    auto table = parse_table(text);
    EXPECT_EQ(table.headers, (std::vector<std::string>{"Full label", "Pk", "Entry point"}));
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"dspaw@nm", "1", "core.code.installed"}));
    EXPECT_EQ(table.footer, "");
}

TEST(ParsersTest, NoSeparatorGivesFooterOnly) {
    auto table = parse_table("  Nothing to show here\nsecond line  \n");
    EXPECT_TRUE(table.headers.empty());
    EXPECT_TRUE(table.rows.empty());
    EXPECT_EQ(table.footer, "Nothing to show here\nsecond line");
}

TEST(ParsersTest, EmptyInput) {
    EXPECT_EQ(parse_table(""), ParsedTable{});
    EXPECT_EQ(parse_table(" \n\t\n"), ParsedTable{});
}

TEST(ParsersTest, RaggedRowsAreNormalized) {
    std::string text =
        "PK  Created  Process label\n"
        "--  -------  -------------\n"
        "1   2h ago\n"
        "2   1h ago   Calc  extra  more\n";

    auto table = parse_table(text);
    ASSERT_EQ(table.rows.size(), 2u);
    for (const auto& row : table.rows) {
        EXPECT_EQ(row.size(), table.headers.size());
    }
    EXPECT_EQ(table.rows[0][2], "");
    EXPECT_EQ(table.rows[1][2], "Calc");
}

TEST(ParsersTest, FooterKeepsTotalsAndSuccessDropsNoise) {
    std::string text =
        "PK  Label\n"
        "--  -----\n"
        "1   one\n"
        "Total results: 1\n"
        "Warning: something noisy\n"
        "Success: all good\n"
        "Info: last time an entry changed state: 1h ago\n";

    auto table = parse_table(text);
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.footer, "Total results: 1\nSuccess: all good");
}

TEST(ParsersTest, FooterModeIsSticky) {
    std::string text =
        "A  B\n"
        "-  -\n"
        "1  2\n"
        "\n"
        "3  4\n";

    auto table = parse_table(text);
    EXPECT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.footer, "3  4");
}

TEST(ParsersTest, SeparatorOnFirstLineHasNoHeaders) {
    auto table = parse_table("-----\nfoo  bar  baz\n");
    EXPECT_TRUE(table.headers.empty());
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].size(), 3u);
}

TEST(ParsersTest, TotalityOnAwkwardInputs) {
    const std::vector<std::string> inputs = {
        "-", "---\n---\n---", "\n\n-\n\n", "a\n-\n", "   -   \n  x  ", "Report: only\n",
        std::string("\0\0-", 3), "\r\n-- --\r\nx  y\r\n"
    };
    for (const auto& input : inputs) {
        auto table = parse_table(input);
        if (!table.headers.empty()) {
            for (const auto& row : table.rows) {
                EXPECT_EQ(row.size(), table.headers.size()) << "input: " << input;
            }
        }
    }
}

TEST(ParsersTest, BulletListAsLabels) {
    auto table = parse_label_list("* localhost\n* nm\n");
    EXPECT_EQ(table.headers, (std::vector<std::string>{"label"}));
    EXPECT_EQ(table.rows, (std::vector<std::vector<std::string>>{{"localhost"}, {"nm"}}));
}

TEST(ParsersTest, LabelListSkipsReports) {
    auto table = parse_label_list("Report: List of configured computers\n* localhost\n\nbare\n");
    EXPECT_EQ(table.rows, (std::vector<std::vector<std::string>>{{"localhost"}, {"bare"}}));
}

TEST(ParsersTest, EntryPointListSkipsSectionHeader) {
    std::string text =
        "Registered entry points for aiida.calculations:\n"
        "* core.arithmetic.add\n"
        "* core.templatereplacer\n"
        "\n"
        "Report: Pass the entry point as an argument to display detailed information\n";

    auto table = parse_entry_point_list(text);
    EXPECT_EQ(table.headers, (std::vector<std::string>{"entry point"}));
    EXPECT_EQ(table.rows, (std::vector<std::vector<std::string>>{
        {"core.arithmetic.add"}, {"core.templatereplacer"}}));
}

TEST(ParsersTest, SubcommandHelp) {
    std::string text =
        "Usage: verdi calcjob [OPTIONS] COMMAND [ARGS]...\n"
        "\n"
        "  Inspect and manage calcjobs.\n"
        "\n"
        "Options:\n"
        "  -h, --help  Show this message and exit.\n"
        "\n"
        "Commands:\n"
        "  cleanworkdir  Clean all content of all output remote folders.\n"
        "  gotocomputer  Open a shell in the remote folder on the calcjob.\n"
        "  inputcat      Show the contents of one of the calcjob input files.\n"
        "  res\n";

    auto table = parse_subcommand_help(text);
    EXPECT_EQ(table.headers, (std::vector<std::string>{"command", "description"}));
    ASSERT_EQ(table.rows.size(), 4u);
    EXPECT_EQ(table.rows[0][0], "cleanworkdir");
    EXPECT_EQ(table.rows[1][1], "Open a shell in the remote folder on the calcjob.");
    EXPECT_EQ(table.rows[3], (std::vector<std::string>{"res", ""}));
}

TEST(ParsersTest, SubcommandHelpStopsAtUnindentedLine) {
    auto table = parse_subcommand_help("Commands:\n  one  first\nTrailer\n  two  second\n");
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0][0], "one");
}

TEST(ParsersTest, IsReportLine) {
    EXPECT_TRUE(is_report_line("Report: x"));
    EXPECT_TRUE(is_report_line("  Success: done"));
    EXPECT_FALSE(is_report_line("Reporting"));
    EXPECT_FALSE(is_report_line("Total results: 3"));
}

TEST(ParsersTest, JsonRecordsUnionOfKeys) {
    std::string text = R"({"data": {"nodes": [{"id": 1, "label": "a"}, {"id": 2, "ctime": null}]}})";

    auto table = parse_json_records(text);
    ASSERT_EQ(table.headers.size(), 3u);
    ASSERT_EQ(table.rows.size(), 2u);
    for (const auto& row : table.rows) {
        EXPECT_EQ(row.size(), 3u);
    }
    EXPECT_EQ(table.footer, "Total results: 2");
}

TEST(ParsersTest, JsonFlatObject) {
    auto table = parse_json_records(R"({"data": {"API_major_version": "4", "available_endpoints": 12}})");
    EXPECT_EQ(table.headers, (std::vector<std::string>{"key", "value"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"API_major_version", "4"}));
    EXPECT_EQ(table.rows[1], (std::vector<std::string>{"available_endpoints", "12"}));
}

TEST(ParsersTest, InvalidJsonFallsBackToFooter) {
    auto table = parse_json_records("  <html>502 Bad Gateway</html>\n");
    EXPECT_TRUE(table.headers.empty());
    EXPECT_TRUE(table.rows.empty());
    EXPECT_EQ(table.footer, "<html>502 Bad Gateway</html>");
}
