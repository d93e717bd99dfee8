#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace streamdl {

// Base of everything the fetcher reports for a request that did not produce a body.
class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& message)
        : std::runtime_error(message) {}
};

// The server answered 404.
class NotFoundError : public DownloadError {
public:
    explicit NotFoundError(const std::string& url)
        : DownloadError("Not found: " + url) {}
};

// Any other non-2xx status, or a failure to build/connect/send the request.
// status() is empty when no HTTP status was received.
class TransferError : public DownloadError {
public:
    explicit TransferError(const std::string& message, std::optional<long> status = std::nullopt)
        : DownloadError(message), status_(status) {}

    [[nodiscard]] std::optional<long> status() const noexcept { return status_; }

private:
    std::optional<long> status_;
};

// Failure while reading the response body. A code of std::errc::interrupted
// means the read should simply be attempted again.
class IoError : public std::system_error {
public:
    IoError(std::error_code code, const std::string& message)
        : std::system_error(code, message) {}

    [[nodiscard]] bool interrupted() const noexcept {
        return code() == std::errc::interrupted;
    }
};

// Bad command line.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace streamdl
