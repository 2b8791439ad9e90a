#include "http_client.hpp"
#include <spdlog/spdlog.h>

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
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

std::string HttpClient::escape(const std::string& value) {
    char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return value;
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

nlohmann::json HttpClient::get_json(const std::string& endpoint) {
    return perform(base_url_ + endpoint, nullptr);
}

nlohmann::json HttpClient::post_json(const std::string& endpoint, const nlohmann::json& body) {
    std::string payload = body.dump();
    return perform(base_url_ + endpoint, &payload);
}

nlohmann::json HttpClient::perform(const std::string& url, const std::string* body) {
    std::string response_string;
    struct curl_slist* headers = nullptr;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl_);
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        throw HttpError(std::string("request failed: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        throw HttpError("HTTP " + std::to_string(status) + " from " + url);
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("Unparseable body from {}: {}", url, response_string);
        throw HttpError(std::string("invalid JSON response: ") + e.what());
    }
}
