#include "core/config.hpp"
#include "core/diagnostic_sink.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace lazyverdi::tui {

namespace {

constexpr double kMaxRefreshIntervalSeconds = 86400.0;

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        target = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Config", std::string("Ignoring '") + key + "': " + e.what());
    }
}

} // namespace

Config::Config()
    : benign_warning_patterns(default_benign_patterns()),
      once_per_session_patterns(default_once_per_session_patterns()) {
}

void Config::normalize() {
    auto_refresh_interval = std::min(auto_refresh_interval, kMaxRefreshIntervalSeconds);
    left_panel_width_percent = std::clamp(left_panel_width_percent, 1, 99);
    results_panel_height_percent = std::clamp(results_panel_height_percent, 1, 99);
    focused_panel_height_percent = std::clamp(focused_panel_height_percent, 1, 99);
    if (initial_focus_panel < 0 || initial_focus_panel > 5) {
        initial_focus_panel = 0;
    }
    if (command_timeout <= 0) {
        command_timeout = 60;
    }
    if (verdi_executable.empty()) {
        verdi_executable = "verdi";
    }
}

std::chrono::milliseconds Config::refresh_interval() const {
    if (auto_refresh_interval <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    double seconds = std::min(auto_refresh_interval, kMaxRefreshIntervalSeconds);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string Config::default_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else {
        const char* home = std::getenv("HOME");
        base = std::filesystem::path(home ? home : ".") / ".config";
    }
    return (base / "lazyverdi" / "config.json").string();
}

Config Config::load(const std::string& path) {
    Config config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_INFO("Config", "No config at " + path + ", writing defaults");
        config.save(path);
        return config;
    }

    std::ifstream in(path);
    if (!in) {
        LOG_WARN("Config", "Cannot read " + path + ", using defaults");
        return config;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("Config", "Corrupt config " + path + ", using defaults");
        return config;
    }

    j.get_to(config);
    config.normalize();
    LOG_INFO("Config", "Loaded " + path);
    return config;
}

bool Config::save(const std::string& path) const {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Config", "Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG_ERROR("Config", "Cannot write " + path);
        return false;
    }
    out << nlohmann::json(*this).dump(2) << "\n";
    if (!out) {
        LOG_ERROR("Config", "Write to " + path + " failed");
        return false;
    }
    return true;
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"auto_refresh_interval", config.auto_refresh_interval},
        {"auto_refresh_on_startup", config.auto_refresh_on_startup},
        {"left_panel_width_percent", config.left_panel_width_percent},
        {"results_panel_height_percent", config.results_panel_height_percent},
        {"focused_panel_height_percent", config.focused_panel_height_percent},
        {"show_welcome_message", config.show_welcome_message},
        {"initial_focus_panel", config.initial_focus_panel},
        {"verdi_executable", config.verdi_executable},
        {"rest_api_url", config.rest_api_url},
        {"command_timeout", config.command_timeout},
        {"log_file", config.log_file},
        {"benign_warning_patterns", config.benign_warning_patterns},
        {"once_per_session_patterns", config.once_per_session_patterns}
    };
}

void from_json(const nlohmann::json& j, Config& config) {
    read_key(j, "auto_refresh_interval", config.auto_refresh_interval);
    read_key(j, "auto_refresh_on_startup", config.auto_refresh_on_startup);
    read_key(j, "left_panel_width_percent", config.left_panel_width_percent);
    read_key(j, "results_panel_height_percent", config.results_panel_height_percent);
    read_key(j, "focused_panel_height_percent", config.focused_panel_height_percent);
    read_key(j, "show_welcome_message", config.show_welcome_message);
    read_key(j, "initial_focus_panel", config.initial_focus_panel);
    read_key(j, "verdi_executable", config.verdi_executable);
    read_key(j, "rest_api_url", config.rest_api_url);
    read_key(j, "command_timeout", config.command_timeout);
    read_key(j, "log_file", config.log_file);
    read_key(j, "benign_warning_patterns", config.benign_warning_patterns);
    read_key(j, "once_per_session_patterns", config.once_per_session_patterns);
}

} // namespace lazyverdi::tui
