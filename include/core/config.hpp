#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lazyverdi::tui {

struct Config {
    double auto_refresh_interval = 10.0;     // seconds, <= 0 disables
    bool auto_refresh_on_startup = true;
    int left_panel_width_percent = 40;
    int results_panel_height_percent = 80;
    int focused_panel_height_percent = 50;
    bool show_welcome_message = true;
    int initial_focus_panel = 0;             // 0 = details, 1-5 = panels
    std::string verdi_executable = "verdi";
    std::string rest_api_url = "http://127.0.0.1:5000/api/v4";
    int command_timeout = 60;                // seconds
    std::string log_file;
    std::vector<std::string> benign_warning_patterns;
    std::vector<std::string> once_per_session_patterns;

    Config();

    // Clamps layout percentages to 1-99, the refresh interval to one day,
    // and resets invalid values.
    void normalize();

    std::chrono::milliseconds refresh_interval() const;

    // $XDG_CONFIG_HOME/lazyverdi/config.json, else ~/.config/lazyverdi/config.json
    static std::string default_path();

    // Missing file: defaults are written to `path`. Unreadable or corrupt
    // file: defaults. Known keys override defaults, unknown keys are ignored.
    static Config load(const std::string& path);

    // Logs and returns false on failure.
    bool save(const std::string& path) const;
};

void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

} // namespace lazyverdi::tui
