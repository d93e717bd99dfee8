#pragma once

#include <curl/curl.h>

#include <memory>

namespace streamdl::detail {

// Initialises libcurl once per process; safe to call from any thread.
// Throws TransferError if libcurl cannot be set up.
void ensureCurlInitialized();

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlMultiDeleter {
    void operator()(CURLM* multi) const noexcept {
        if (multi) {
            curl_multi_cleanup(multi);
        }
    }
};

struct CurlUrlDeleter {
    void operator()(CURLU* url) const noexcept {
        if (url) {
            curl_url_cleanup(url);
        }
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlMultiHandle = std::unique_ptr<CURLM, CurlMultiDeleter>;
using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

} // namespace streamdl::detail
