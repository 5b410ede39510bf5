#include "curl_http_client.hpp"
#include "error.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace bitcli {

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Appends each received chunk to the std::string passed as userdata
size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(data, size * nmemb);
    return size * nmemb;
}

std::once_flag curl_init_flag;

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
    std::call_once(curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw WalletError(WalletError::ErrorType::NetworkError, "Failed to initialize libcurl");
        }
    });
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::get(const std::string& url) {
    return perform(url, nullptr, "");
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const std::string& content_type) {
    return perform(url, &body, content_type);
}

// Run one request and capture status and body.
// A missing response (DNS, connect, TLS, timeout) is a NetworkError; HTTP
// error statuses are returned to the caller untouched.
HttpResponse CurlHttpClient::perform(const std::string& url, const std::string* body,
                                     const std::string& content_type) {
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw WalletError(WalletError::ErrorType::NetworkError, "Failed to create curl handle");
    }

    HttpResponse response;
    SlistPtr headers(nullptr, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (body) {
        if (!content_type.empty()) {
            const std::string header = "Content-Type: " + content_type;
            headers.reset(curl_slist_append(nullptr, header.c_str()));
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        }
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    } else {
        // Only reads follow redirects; a broadcast goes to the URL it was given
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw WalletError(WalletError::ErrorType::NetworkError,
            "Request to " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace bitcli
