#include "http_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>

std::optional<nlohmann::json> HttpClient::get_json(const std::string& url) {
    return parse_response(url, get(url));
}

std::optional<nlohmann::json> HttpClient::post_json(const std::string& url,
                                                   const nlohmann::json& payload) {
    return parse_response(url, post(url, payload.dump(), "application/json"));
}

std::optional<nlohmann::json> HttpClient::parse_response(const std::string& url,
                                                        const std::optional<HttpResponse>& response) {
    if (!response.has_value()) {
        return std::nullopt;
    }

    if (response->status < 200 || response->status >= 300) {
        spdlog::warn("HTTP {} from {}", response->status, util::redact_url(url));
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(response->body);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse response from {}: {}", util::redact_url(url), e.what());
        return std::nullopt;
    }
}

CurlHttpClient::CurlHttpClient(int timeout_ms) : timeout_ms_(timeout_ms) {}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::optional<HttpResponse> CurlHttpClient::get(const std::string& url) {
    return perform(url, nullptr, "");
}

std::optional<HttpResponse> CurlHttpClient::post(const std::string& url,
                                                 const std::string& body,
                                                 const std::string& content_type) {
    return perform(url, &body, content_type);
}

// One easy handle per call: requests are issued from resolver worker threads.
std::optional<HttpResponse> CurlHttpClient::perform(const std::string& url,
                                                    const std::string* body,
                                                    const std::string& content_type) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        spdlog::error("Failed to initialize CURL");
        return std::nullopt;
    }

    HttpResponse response;
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    if (body != nullptr) {
        headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        spdlog::warn("HTTP request to {} failed: {}", util::redact_url(url), curl_easy_strerror(res));
        return std::nullopt;
    }

    return response;
}
