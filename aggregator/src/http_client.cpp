#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpClient::HttpClient(std::string user_agent)
    : curl_(curl_easy_init())
    , user_agent_(std::move(user_agent))
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpClient::build_query(const std::map<std::string, std::string>& params) {
    std::string query;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) query += "&";
        first = false;

        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.length()));
        query += key + "=" + (escaped ? std::string(escaped) : std::string());
        curl_free(escaped);
    }
    return query;
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& params,
                             std::chrono::milliseconds timeout) {
    HttpResponse response;
    std::string full_url = url;
    if (!params.empty()) {
        full_url += "?" + build_query(params);
    }

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);   // required for timeouts off the main thread
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());

    response.curl_code = curl_easy_perform(curl_);
    if (response.curl_code != CURLE_OK) {
        response.error = curl_easy_strerror(response.curl_code);
        return response;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

JsonResponse HttpClient::get_json(const std::string& url,
                                  const std::map<std::string, std::string>& params,
                                  std::chrono::milliseconds timeout) {
    JsonResponse out;
    auto response = get(url, params, timeout);

    if (!response.transport_ok()) {
        out.error = FetchError{
            response.timed_out() ? FetchErrorKind::Timeout : FetchErrorKind::Transport,
            url + ": " + response.error
        };
        return out;
    }

    if (!response.is_success()) {
        out.error = FetchError{
            FetchErrorKind::HttpStatus,
            url + ": HTTP " + std::to_string(response.status_code)
        };
        return out;
    }

    try {
        out.json = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Unparsable body from {}: {}", url, e.what());
        out.error = FetchError{FetchErrorKind::Malformed, url + ": " + e.what()};
    }
    return out;
}
