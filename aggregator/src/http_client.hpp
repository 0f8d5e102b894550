#pragma once

#include "types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

struct HttpResponse {
    long status_code = 0;
    std::string body;
    CURLcode curl_code = CURLE_OK;
    std::string error;

    bool transport_ok() const { return curl_code == CURLE_OK; }
    bool is_success() const { return transport_ok() && status_code >= 200 && status_code < 300; }
    bool timed_out() const { return curl_code == CURLE_OPERATION_TIMEDOUT; }
};

struct JsonResponse {
    std::optional<nlohmann::json> json;
    FetchError error;
};

// One curl easy handle. Not thread-safe: each source client owns its own.
// No retries; the refresh coordinator owns retry policy.
class HttpClient {
public:
    explicit HttpClient(std::string user_agent = "btc_signals/1.0");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& params,
                     std::chrono::milliseconds timeout);

    // Maps transport errors, non-2xx statuses and unparsable bodies to FetchError
    JsonResponse get_json(const std::string& url,
                          const std::map<std::string, std::string>& params,
                          std::chrono::milliseconds timeout);

private:
    CURL* curl_;
    std::string user_agent_;

    std::string build_query(const std::map<std::string, std::string>& params);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
