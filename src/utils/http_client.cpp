#include "utils/http_client.hpp"
#include "utils/logger.hpp"
#include <curl/curl.h>

namespace lazyverdi::tui {

namespace {

// Callback for curl to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_global_init() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        LOG_ERROR("HttpClient", std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
}

} // namespace

std::optional<json> HttpResponse::as_json() const {
    if (!success || body.empty()) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("HttpResponse", std::string("JSON parse error: ") + e.what());
        return std::nullopt;
    }
}

HttpClient::HttpClient(const std::string& base_url)
    : base_url_(base_url) {
    ensure_curl_global_init();
    handle_ = curl_easy_init();
    if (!handle_) {
        LOG_ERROR("HttpClient", "Failed to initialize CURL handle");
    }
    LOG_INFO("HttpClient", "Initialized with base URL: " + base_url);
}

HttpClient::~HttpClient() {
    if (handle_) {
        curl_easy_cleanup(handle_);
    }
}

HttpResponse HttpClient::get(const std::string& path) {
    return perform_request(full_url(path));
}

void HttpClient::reset_session() {
    std::lock_guard<std::mutex> lock(mutex_);

    // curl_easy_reset keeps live connections, so the handle is recreated
    if (handle_) {
        curl_easy_cleanup(handle_);
    }
    handle_ = curl_easy_init();
    if (!handle_) {
        LOG_ERROR("HttpClient", "Failed to recreate CURL handle");
    }
}

void HttpClient::set_timeout(long timeout_seconds) {
    timeout_ = timeout_seconds;
}

void HttpClient::set_connect_timeout(long timeout_seconds) {
    connect_timeout_ = timeout_seconds;
}

std::string HttpClient::full_url(const std::string& path) const {
    if (path.empty() || path[0] != '/') {
        return base_url_ + "/" + path;
    }
    return base_url_ + path;
}

HttpResponse HttpClient::perform_request(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handle_) {
        return HttpResponse{
            .status_code = 0,
            .body = "",
            .success = false,
            .error_message = "Failed to initialize CURL"
        };
    }

    CURL* curl = handle_;
    curl_easy_reset(curl);

    std::string response_body;
    struct curl_slist* header_list = curl_slist_append(nullptr, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    // Set timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    CURLcode res = curl_easy_perform(curl);

    HttpResponse response;

    if (res != CURLE_OK) {
        response.status_code = 0;
        response.success = false;
        response.error_message = curl_easy_strerror(res);
        LOG_WARN("HttpClient", url + ": " + response.error_message);
    } else {
        long status_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

        response.status_code = status_code;
        response.body = std::move(response_body);
        response.success = (status_code >= 200 && status_code < 300);
        response.error_message = response.success ? "" : "HTTP " + std::to_string(status_code);

        if (!response.success) {
            LOG_WARN("HttpClient", "Request returned status " + std::to_string(status_code));
        }
    }

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    return response;
}

} // namespace lazyverdi::tui
