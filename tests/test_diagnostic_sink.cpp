#include <gtest/gtest.h>
#include "core/diagnostic_sink.hpp"

using namespace lazyverdi::tui;

class DiagnosticSinkTest : public ::testing::Test {
protected:
    DiagnosticSink sink{default_benign_patterns(), default_once_per_session_patterns()};
};

TEST_F(DiagnosticSinkTest, Normalize) {
    EXPECT_EQ(DiagnosticSink::normalize("  Warning:\n  Configuration   FILE\tmissing  "),
              "warning: configuration file missing");
    EXPECT_EQ(DiagnosticSink::normalize(""), "");
}

TEST_F(DiagnosticSinkTest, EmptyStderrWritesNothing) {
    EXPECT_FALSE(sink.report("code list", "  \n"));
    EXPECT_TRUE(sink.lines().empty());
    EXPECT_EQ(sink.revision(), 0u);
}

TEST_F(DiagnosticSinkTest, BenignWarningIsSuppressed) {
    EXPECT_FALSE(sink.report("code list",
        "Warning: Configuration file\n   /home/u/.aiida/config.json does not exist"));
    EXPECT_TRUE(sink.lines().empty());
}

TEST_F(DiagnosticSinkTest, OtherErrorsAreWrittenAsIs) {
    EXPECT_TRUE(sink.report("group list", "Critical: database is locked\n"));
    EXPECT_EQ(sink.lines(), (std::vector<std::string>{"Critical: database is locked"}));
}

TEST_F(DiagnosticSinkTest, MissingProfileShownOncePerSession) {
    EXPECT_TRUE(sink.report("code list", "Critical: no default profile found"));
    EXPECT_FALSE(sink.report("group list", "Critical: No default  profile found"));
    EXPECT_FALSE(sink.report("node list", "critical: no profile"));

    auto lines = sink.lines();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "No AiiDA profile configured.");
}

TEST_F(DiagnosticSinkTest, FriendlyMessages) {
    EXPECT_EQ(format_error_message("computer list", "No computers found"),
              "No computers configured.\n\nUse 'verdi computer setup' to add computers.");
    EXPECT_EQ(format_error_message("process list", "No processes"),
              "No processes found.\n\nSubmit calculations to see them here.");
    EXPECT_EQ(format_error_message("group list", "boom"), "boom");
    EXPECT_EQ(format_error_message("group list", ""), "Command failed");
    EXPECT_EQ(format_error_message("profile list", "anything").rfind("No AiiDA profile configured.", 0), 0u);
}

TEST_F(DiagnosticSinkTest, WriteSplitsLines) {
    sink.write("LazyVerdi v1.0.0\nWelcome! Press ? for help");
    EXPECT_EQ(sink.lines(), (std::vector<std::string>{"LazyVerdi v1.0.0", "Welcome! Press ? for help"}));
    EXPECT_EQ(sink.revision(), 1u);

    sink.clear();
    EXPECT_TRUE(sink.lines().empty());
    EXPECT_EQ(sink.revision(), 2u);
}

TEST(DiagnosticSinkLimitTest, OldestLinesDropped) {
    DiagnosticSink sink({}, {}, 3);
    for (int i = 0; i < 5; ++i) {
        sink.write("line " + std::to_string(i));
    }
    EXPECT_EQ(sink.lines(), (std::vector<std::string>{"line 2", "line 3", "line 4"}));
}

TEST(DiagnosticSinkPatternTest, InvalidPatternIsSkipped) {
    DiagnosticSink sink({"([unclosed", "harmless"}, {});
    EXPECT_FALSE(sink.report("x", "Something HARMLESS happened"));
    EXPECT_TRUE(sink.report("x", "something else"));
}
