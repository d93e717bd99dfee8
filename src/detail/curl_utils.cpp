#include "streamdl/detail/curl_utils.hpp"

#include "streamdl/errors.hpp"

#include <fmt/format.h>

namespace streamdl::detail {

namespace {

// Owns libcurl's process-wide state for the lifetime of the program.
class CurlGlobal {
public:
    CurlGlobal() : result_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}

    ~CurlGlobal() {
        if (result_ == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] CURLcode result() const noexcept { return result_; }

private:
    CURLcode result_;
};

} // namespace

void ensureCurlInitialized() {
    static const CurlGlobal global;
    if (global.result() != CURLE_OK) {
        throw TransferError(fmt::format("Failed to initialize libcurl: {}",
                                        curl_easy_strerror(global.result())));
    }
}

} // namespace streamdl::detail
