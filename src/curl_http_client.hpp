#pragma once

#include "http_client.hpp"

namespace bitcli {

// HttpClient backed by a libcurl easy handle per request
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::string& content_type) override;

private:
    HttpResponse perform(const std::string& url, const std::string* body,
                         const std::string& content_type);

    long timeout_seconds_;
};

} // namespace bitcli
