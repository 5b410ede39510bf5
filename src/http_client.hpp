#pragma once

#include <string>

namespace bitcli {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP transport used to reach the block explorer.
//
// Implementations return any HTTP response, successful or not, and throw
// WalletError(NetworkError) only when no response was received.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const std::string& content_type) = 0;
};

} // namespace bitcli
