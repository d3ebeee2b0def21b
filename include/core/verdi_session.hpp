#pragma once

#include "core/command.hpp"
#include "core/session_scope.hpp"
#include "utils/http_client.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace lazyverdi::tui {

struct VerdiSessionOptions {
    std::string verdi_executable = "verdi";
    std::string rest_api_url = "http://127.0.0.1:5000/api/v4";
    std::chrono::seconds command_timeout{60};
};

// The backend: `verdi` subprocesses plus an optional REST endpoint. Holds the
// reusable HTTP connection, which is the state reset() throws away.
class VerdiSession : public SessionScope {
public:
    explicit VerdiSession(VerdiSessionOptions options);
    ~VerdiSession() override = default;

    void reset() override;

    // Invokers for StructuredQuery. `path` is the verdi subcommand path
    // ("computer", "list"); call-time args are appended.
    Invoker verdi_invoker(std::vector<std::string> path);
    Invoker rest_invoker(std::string endpoint);

    // Multi-line health summary, built from `verdi --version`, the config
    // directory and REST reachability. Used by the status tab.
    std::string status_report();

    const VerdiSessionOptions& options() const { return options_; }
    int reset_count() const { return reset_count_.load(); }

private:
    InvocationOutput run_verdi(const std::vector<std::string>& args,
                               const std::atomic<bool>& cancel_requested);
    InvocationOutput rest_get(const std::string& endpoint);

    VerdiSessionOptions options_;
    std::string verdi_path_;
    std::unique_ptr<HttpClient> http_;
    std::atomic<int> reset_count_{0};
};

// AiiDA configuration directory: $AIIDA_PATH/.aiida or ~/.aiida.
std::string aiida_config_dir();

} // namespace lazyverdi::tui
