#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Blocking JSON-over-HTTP client. Not thread safe: one handle per owner.
class HttpClient {
public:
    HttpClient(const std::string& base_url, int timeout_ms = 8000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    nlohmann::json get_json(const std::string& endpoint);
    nlohmann::json post_json(const std::string& endpoint, const nlohmann::json& body);

    std::string escape(const std::string& value);

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json perform(const std::string& url, const std::string* body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
