#include "streamdl/http_fetcher.hpp"

#include "streamdl/detail/curl_utils.hpp"
#include "streamdl/errors.hpp"
#include "streamdl/log.hpp"
#include "streamdl/streaming_reader.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cstring>
#include <string_view>
#include <utility>

namespace streamdl {

namespace {

// Pulls the body of a single transfer out of libcurl's multi interface on demand.
class CurlResponseStream final : public ResponseStream {
public:
    CurlResponseStream(const std::string& url, const FetcherConfig& config)
        : url_(url), certificate_(config.root_certificate) {
        detail::ensureCurlInitialized();

        multi_.reset(curl_multi_init());
        easy_.reset(curl_easy_init());
        if (!multi_ || !easy_) {
            throw TransferError("Failed to allocate curl handle");
        }

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlResponseStream::writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlResponseStream::headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);

        // The resolver is authoritative; an empty proxy keeps libcurl from
        // consulting the environment on its own.
        proxy_ = config.proxies.proxyFor(url_).value_or("");
        if (!proxy_.empty()) {
            logInfo("Using proxy {} for {}", proxy_, url_);
        }
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());

        if (certificate_) {
            // Best effort: TLS backends without SSL_CTX support reject these
            // options and the default trust store is used unchanged.
            static_cast<void>(curl_easy_setopt(curl, CURLOPT_SSL_CTX_FUNCTION,
                                               &CurlResponseStream::sslContextCallback));
            static_cast<void>(curl_easy_setopt(curl, CURLOPT_SSL_CTX_DATA, &*certificate_));
        }

        const CURLMcode added = curl_multi_add_handle(multi_.get(), curl);
        if (added != CURLM_OK) {
            throw TransferError(std::string{"curl error: "} + curl_multi_strerror(added));
        }
        attached_ = true;
    }

    ~CurlResponseStream() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlResponseStream(const CurlResponseStream&) = delete;
    CurlResponseStream& operator=(const CurlResponseStream&) = delete;

    // Drives the transfer until the final response headers are in, then
    // classifies the status.
    void awaitResponse() {
        while (!done_) {
            if (headers_complete_) {
                // Proxy CONNECT replies (no response code yet), interim and
                // redirect responses are followed by another header block.
                const long code = responseCode();
                const bool interim = code < 200;
                const bool redirect = code >= 300 && code < 400;
                if (!interim && !redirect) {
                    break;
                }
                headers_complete_ = false;
            }
            if (hasPending()) {
                break;
            }
            // No status yet, so any failure is a failed request rather than a failed read.
            try {
                pump();
            } catch (const IoError& e) {
                throw TransferError(fmt::format("Failed to download {}: {}", url_, e.what()));
            }
        }
        response_received_ = true;

        if (done_ && result_ != CURLE_OK) {
            throw TransferError(fmt::format("Failed to download {}: {}", url_, errorMessage()));
        }

        const long code = responseCode();
        if (code == 404) {
            throw NotFoundError(url_);
        }
        if (code < 200 || code >= 300) {
            throw TransferError(fmt::format("Failed to download {}: HTTP status {}", url_, code), code);
        }

        curl_off_t length = -1;
        if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK
            && length >= 0) {
            content_length_ = static_cast<std::uint64_t>(length);
        }
        if (content_length_) {
            logInfo("{} answered {}, {} bytes advertised", url_, code, *content_length_);
        } else {
            logInfo("{} answered {} without a length", url_, code);
        }
    }

    std::size_t read(char* buffer, std::size_t size) override {
        while (!hasPending()) {
            pending_.clear();
            pending_offset_ = 0;
            if (done_) {
                if (result_ != CURLE_OK) {
                    throw IoError(std::make_error_code(std::errc::io_error),
                                  fmt::format("Failed to read {}: {}", url_, errorMessage()));
                }
                return 0;
            }
            pump();
        }

        const std::size_t count = std::min(size, pending_.size() - pending_offset_);
        std::memcpy(buffer, pending_.data() + pending_offset_, count);
        pending_offset_ += count;
        return count;
    }

    [[nodiscard]] std::optional<std::uint64_t> contentLength() const override {
        return content_length_;
    }

private:
    [[nodiscard]] bool hasPending() const noexcept { return pending_offset_ < pending_.size(); }

    [[nodiscard]] long responseCode() const {
        long code = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    [[nodiscard]] std::string errorMessage() const {
        if (error_buffer_[0] != '\0') {
            return error_buffer_;
        }
        return curl_easy_strerror(result_);
    }

    // One round of I/O: let libcurl do what it can, then wait for the socket
    // if that produced nothing to hand out.
    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            throw IoError(std::make_error_code(std::errc::io_error),
                          std::string{"curl error: "} + curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                result_ = msg->data.result;
            }
        }
        if (running == 0) {
            done_ = true;
        }

        // Fresh final headers are classified before waiting any longer.
        const bool headers_to_classify = headers_complete_ && !response_received_;
        if (!done_ && !hasPending() && !headers_to_classify) {
            mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
            if (mc != CURLM_OK) {
                throw IoError(std::make_error_code(std::errc::io_error),
                              std::string{"curl error: "} + curl_multi_strerror(mc));
            }
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        const size_t total = size * nmemb;
        self->pending_.append(ptr, total);
        return total;
    }

    static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        const size_t total = size * nmemb;
        const std::string_view line{ptr, total};
        if (line.rfind("HTTP/", 0) == 0) {
            self->headers_complete_ = false;
        } else if (line == "\r\n" || line == "\n") {
            self->headers_complete_ = true;
        }
        return total;
    }

    static CURLcode sslContextCallback(CURL*, void* ssl_ctx, void* userptr) {
        const auto* cert = static_cast<const Certificate*>(userptr);
        X509_STORE* store = SSL_CTX_get_cert_store(static_cast<SSL_CTX*>(ssl_ctx));
        if (store && cert && X509_STORE_add_cert(store, cert->native()) != 1) {
            // Already present in the store, or rejected: either way the
            // default trust store still applies.
            ERR_clear_error();
        }
        return CURLE_OK;
    }

    static constexpr int kPollTimeoutMs = 1000;
    static constexpr long kMaxRedirects = 10;

    std::string url_;
    std::optional<Certificate> certificate_;
    std::string proxy_;

    detail::CurlMultiHandle multi_;
    detail::CurlHandle easy_;
    bool attached_{false};
    char error_buffer_[CURL_ERROR_SIZE]{};

    std::string pending_;
    std::size_t pending_offset_{0};
    bool headers_complete_{false};
    bool response_received_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
    std::optional<std::uint64_t> content_length_;
};

} // namespace

HttpFetcher::HttpFetcher(const FetcherConfig& config) : config_(config) {}

ResponseStreamPtr HttpFetcher::fetch(const std::string& url) const {
    auto stream = std::make_unique<CurlResponseStream>(url, config_);
    stream->awaitResponse();
    return stream;
}

std::vector<char> downloadWithProgress(const HttpFetcher& fetcher, const std::string& url,
                                       std::ostream& status) {
    const ResponseStreamPtr stream = fetcher.fetch(url);
    StreamingReader reader(*stream, status);
    return reader.download();
}

} // namespace streamdl
