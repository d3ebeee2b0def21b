#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/diagnostic_sink.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lazyverdi::tui;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;
    std::string path;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("lazyverdi_config_test_" + std::to_string(::getpid()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        path = (dir / "nested" / "config.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write_file(const std::string& text) {
        fs::create_directories(fs::path(path).parent_path());
        std::ofstream(path) << text;
    }
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_DOUBLE_EQ(config.auto_refresh_interval, 10.0);
    EXPECT_TRUE(config.auto_refresh_on_startup);
    EXPECT_EQ(config.left_panel_width_percent, 40);
    EXPECT_EQ(config.results_panel_height_percent, 80);
    EXPECT_EQ(config.focused_panel_height_percent, 50);
    EXPECT_EQ(config.initial_focus_panel, 0);
    EXPECT_EQ(config.verdi_executable, "verdi");
    EXPECT_EQ(config.benign_warning_patterns, default_benign_patterns());
    EXPECT_EQ(config.refresh_interval(), std::chrono::milliseconds(10000));
}

TEST_F(ConfigTest, MissingFileWritesDefaults) {
    Config config = Config::load(path);
    EXPECT_EQ(config.left_panel_width_percent, 40);
    ASSERT_TRUE(fs::exists(path));

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["auto_refresh_interval"].get<double>(), 10.0);
    EXPECT_EQ(j["verdi_executable"].get<std::string>(), "verdi");
}

TEST_F(ConfigTest, KnownKeysOverrideDefaults) {
    write_file(R"({"auto_refresh_interval": 2.5, "left_panel_width_percent": 30,
                   "initial_focus_panel": 3, "unknown_key": true})");

    Config config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.auto_refresh_interval, 2.5);
    EXPECT_EQ(config.left_panel_width_percent, 30);
    EXPECT_EQ(config.initial_focus_panel, 3);
    EXPECT_EQ(config.results_panel_height_percent, 80);
    EXPECT_EQ(config.refresh_interval(), std::chrono::milliseconds(2500));
}

TEST_F(ConfigTest, WrongTypeKeepsDefault) {
    write_file(R"({"left_panel_width_percent": "wide", "command_timeout": 15})");

    Config config = Config::load(path);
    EXPECT_EQ(config.left_panel_width_percent, 40);
    EXPECT_EQ(config.command_timeout, 15);
}

TEST_F(ConfigTest, OutOfRangeValuesClamped) {
    write_file(R"({"left_panel_width_percent": 150, "focused_panel_height_percent": -4,
                   "initial_focus_panel": 9, "command_timeout": 0})");

    Config config = Config::load(path);
    EXPECT_EQ(config.left_panel_width_percent, 99);
    EXPECT_EQ(config.focused_panel_height_percent, 1);
    EXPECT_EQ(config.initial_focus_panel, 0);
    EXPECT_EQ(config.command_timeout, 60);
}

TEST_F(ConfigTest, HugeIntervalClampedToOneDay) {
    write_file(R"({"auto_refresh_interval": 1e300})");

    Config config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.auto_refresh_interval, 86400.0);
    EXPECT_EQ(config.refresh_interval(), std::chrono::milliseconds(86400000));

    Config unnormalized;
    unnormalized.auto_refresh_interval = 1e300;
    EXPECT_EQ(unnormalized.refresh_interval(), std::chrono::milliseconds(86400000));
}

TEST_F(ConfigTest, CorruptFileFallsBackToDefaults) {
    write_file("{ this is not json");

    Config config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.auto_refresh_interval, 10.0);
    EXPECT_EQ(config.left_panel_width_percent, 40);
}

TEST_F(ConfigTest, NonPositiveIntervalDisablesRefresh) {
    write_file(R"({"auto_refresh_interval": 0})");
    EXPECT_EQ(Config::load(path).refresh_interval(), std::chrono::milliseconds(0));
}

TEST_F(ConfigTest, SaveAndLoadKeepsValues) {
    Config config;
    config.rest_api_url = "http://localhost:5001/api/v4";
    config.once_per_session_patterns = {"profile"};
    ASSERT_TRUE(config.save(path));

    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.rest_api_url, "http://localhost:5001/api/v4");
    EXPECT_EQ(loaded.once_per_session_patterns, (std::vector<std::string>{"profile"}));
}

TEST(ConfigPathTest, UsesXdgConfigHome) {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(Config::default_path(), "/tmp/xdg/lazyverdi/config.json");

    if (previous) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}
