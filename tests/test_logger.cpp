#include <gtest/gtest.h>
#include "utils/logger.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lazyverdi::tui;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().clear();
        Logger::instance().set_min_level(LogLevel::DEBUG);
        Logger::instance().set_max_entries(1000);
    }

    void TearDown() override {
        Logger::instance().set_log_file("");
        Logger::instance().clear();
    }
};

TEST_F(LoggerTest, KeepsRecentEntries) {
    LOG_INFO("Dashboard", "Mounted panel-1");
    LOG_WARN("CommandRunner", "code list raised");

    auto logs = Logger::instance().get_recent_logs(10);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].source, "Dashboard");
    EXPECT_EQ(logs[0].level_str(), "INFO");
    EXPECT_EQ(logs[1].message, "code list raised");
    EXPECT_EQ(logs[1].level_str(), "WARN");
}

TEST_F(LoggerTest, MinLevelFilters) {
    Logger::instance().set_min_level(LogLevel::WARN);
    LOG_DEBUG("x", "dropped");
    LOG_INFO("x", "dropped");
    LOG_ERROR("x", "kept");

    auto logs = Logger::instance().get_recent_logs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].message, "kept");
}

TEST_F(LoggerTest, MaxEntriesDropsOldest) {
    Logger::instance().set_max_entries(3);
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("x", "entry " + std::to_string(i));
    }

    auto logs = Logger::instance().get_recent_logs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs.front().message, "entry 2");
    EXPECT_EQ(Logger::instance().get_recent_logs(1).front().message, "entry 4");
}

TEST_F(LoggerTest, MirrorsToFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("lazyverdi_logger_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    ASSERT_TRUE(Logger::instance().set_log_file(path.string()));
    LOG_CRITICAL("main", "Fatal error: boom");
    Logger::instance().set_log_file("");

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[CRITICAL] main: Fatal error: boom"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, TimestampFormat) {
    LOG_INFO("x", "y");
    auto stamp = Logger::instance().get_recent_logs(1).front().format_timestamp();
    ASSERT_EQ(stamp.size(), 12u);
    EXPECT_EQ(stamp[2], ':');
    EXPECT_EQ(stamp[8], '.');
}
