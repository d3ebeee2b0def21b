#include "core/verdi_session.hpp"
#include "utils/logger.hpp"
#include "utils/process.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace lazyverdi::tui {

namespace {

std::string trim_copy(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string default_profile_name(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in) return {};
    json config = json::parse(in, nullptr, false);
    if (config.is_discarded() || !config.is_object()) return {};
    return config.value("default_profile", std::string{});
}

} // namespace

std::string aiida_config_dir() {
    if (const char* aiida_path = std::getenv("AIIDA_PATH"); aiida_path && *aiida_path) {
        return (std::filesystem::path(aiida_path) / ".aiida").string();
    }
    const char* home = std::getenv("HOME");
    return (std::filesystem::path(home ? home : ".") / ".aiida").string();
}

VerdiSession::VerdiSession(VerdiSessionOptions options)
    : options_(std::move(options)),
      verdi_path_(find_executable(options_.verdi_executable)),
      http_(std::make_unique<HttpClient>(options_.rest_api_url)) {
    http_->set_timeout(static_cast<long>(options_.command_timeout.count()));
    http_->set_connect_timeout(5L);

    if (verdi_path_.empty()) {
        LOG_WARN("VerdiSession", "verdi executable not found: " + options_.verdi_executable);
    } else {
        LOG_INFO("VerdiSession", "Using " + verdi_path_);
    }
}

void VerdiSession::reset() {
    int reaped = reap_exited_children();
    if (reaped > 0) {
        LOG_DEBUG("VerdiSession", "Reaped " + std::to_string(reaped) + " stray processes");
    }
    http_->reset_session();
    reset_count_++;
}

Invoker VerdiSession::verdi_invoker(std::vector<std::string> path) {
    return [this, path = std::move(path)](const std::vector<std::string>& args,
                                          const std::atomic<bool>& cancel_requested) {
        std::vector<std::string> full(path);
        full.insert(full.end(), args.begin(), args.end());
        return run_verdi(full, cancel_requested);
    };
}

Invoker VerdiSession::rest_invoker(std::string endpoint) {
    return [this, endpoint = std::move(endpoint)](const std::vector<std::string>&,
                                                  const std::atomic<bool>& cancel_requested) {
        if (cancel_requested.load()) {
            return InvocationOutput{.stdout_text = "", .stderr_text = "", .exit_code = 130};
        }
        return rest_get(endpoint);
    };
}

InvocationOutput VerdiSession::run_verdi(const std::vector<std::string>& args,
                                         const std::atomic<bool>& cancel_requested) {
    if (verdi_path_.empty()) {
        throw std::runtime_error("verdi executable not found on PATH: " +
                                 options_.verdi_executable);
    }

    std::vector<std::string> argv{verdi_path_};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOutput output;
    try {
        output = run_process(argv, options_.command_timeout, cancel_requested);
    } catch (const std::exception&) {
        std::throw_with_nested(std::runtime_error("failed to run " + verdi_path_));
    }

    if (output.timed_out) {
        LOG_WARN("VerdiSession", "Timed out: verdi " + (args.empty() ? "" : args.front()));
    }
    return InvocationOutput{
        .stdout_text = std::move(output.out),
        .stderr_text = std::move(output.err),
        .exit_code = output.exit_code
    };
}

InvocationOutput VerdiSession::rest_get(const std::string& endpoint) {
    auto response = http_->get(endpoint);

    if (response.status_code == 0) {
        throw std::runtime_error("REST API unreachable at " + http_->full_url(endpoint) +
                                 ": " + response.error_message);
    }
    if (!response.success) {
        return InvocationOutput{
            .stdout_text = "",
            .stderr_text = "HTTP " + std::to_string(response.status_code) + " from " +
                           http_->full_url(endpoint) + "\n" + response.body,
            .exit_code = 1
        };
    }
    return InvocationOutput{.stdout_text = std::move(response.body), .stderr_text = "", .exit_code = 0};
}

std::string VerdiSession::status_report() {
    std::vector<std::string> lines;
    auto join = [&lines]() {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    };

    std::atomic<bool> never_cancelled{false};
    if (verdi_path_.empty()) {
        lines.push_back("✘ version:     verdi not found (" + options_.verdi_executable + ")");
        return join();
    }
    auto version = run_process({verdi_path_, "--version"}, std::chrono::seconds(15), never_cancelled);
    if (version.exit_code != 0) {
        lines.push_back("✘ version:     " + trim_copy(version.err));
        return join();
    }
    lines.push_back("✔ version:     " + trim_copy(version.out));

    std::filesystem::path config_dir(aiida_config_dir());
    std::error_code ec;
    if (!std::filesystem::is_directory(config_dir, ec)) {
        lines.push_back("✘ config:      " + config_dir.string() + " does not exist");
        return join();
    }
    lines.push_back("✔ config:      " + config_dir.string());

    std::string profile = default_profile_name(config_dir / "config.json");
    if (profile.empty()) {
        lines.push_back("⚠ profile:     No profile configured");
        lines.push_back("");
        lines.push_back("To set up AiiDA, run:");
        lines.push_back("  verdi quicksetup");
        return join();
    }
    lines.push_back("✔ profile:     " + profile);

    auto server = http_->get("/server");
    if (server.success) {
        std::string api_version;
        if (auto body = server.as_json(); body && body->contains("data") && (*body)["data"].is_object()) {
            api_version = (*body)["data"].value("API_version", std::string{});
        }
        lines.push_back("✔ rest api:    " + options_.rest_api_url +
                        (api_version.empty() ? "" : " (v" + api_version + ")"));
    } else {
        lines.push_back("⚠ rest api:    unreachable (" + options_.rest_api_url + ")");
    }
    return join();
}

} // namespace lazyverdi::tui
