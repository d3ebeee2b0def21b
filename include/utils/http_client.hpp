#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace lazyverdi::tui {

using json = nlohmann::json;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    bool success = false;
    std::string error_message;

    // Parse as JSON
    std::optional<json> as_json() const;
};

// Read-only HTTP client around one reusable curl easy handle. The handle keeps
// connections and cookies between requests, so it is backend session state:
// reset_session() drops all of it.
class HttpClient {
public:
    explicit HttpClient(const std::string& base_url);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& path);

    void reset_session();

    // Configuration
    void set_timeout(long timeout_seconds);
    void set_connect_timeout(long timeout_seconds);

    std::string full_url(const std::string& path) const;
    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    long timeout_ = 30L;
    long connect_timeout_ = 10L;

    std::mutex mutex_;
    CURL* handle_ = nullptr;

    HttpResponse perform_request(const std::string& url);
};

} // namespace lazyverdi::tui
