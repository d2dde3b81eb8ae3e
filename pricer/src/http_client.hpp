#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Transport seam shared by the aggregator and node clients. Implementations
// return std::nullopt on transport failure instead of throwing.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::optional<HttpResponse> get(const std::string& url) = 0;
    virtual std::optional<HttpResponse> post(const std::string& url,
                                             const std::string& body,
                                             const std::string& content_type) = 0;

    // nullopt on transport failure, non-2xx status or unparsable body
    std::optional<nlohmann::json> get_json(const std::string& url);
    std::optional<nlohmann::json> post_json(const std::string& url, const nlohmann::json& payload);

private:
    static std::optional<nlohmann::json> parse_response(const std::string& url,
                                                        const std::optional<HttpResponse>& response);
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int timeout_ms = 8000);

    std::optional<HttpResponse> get(const std::string& url) override;
    std::optional<HttpResponse> post(const std::string& url,
                                     const std::string& body,
                                     const std::string& content_type) override;

private:
    int timeout_ms_;

    std::optional<HttpResponse> perform(const std::string& url, const std::string* body,
                                        const std::string& content_type);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
