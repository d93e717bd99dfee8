#pragma once

#include "config.hpp"
#include "response_stream.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace streamdl {

// Issues a single GET per fetch() and classifies the response.
class HttpFetcher {
public:
    // `config` must outlive the fetcher.
    explicit HttpFetcher(const FetcherConfig& config);

    // Returns the body stream of a 2xx response. Throws NotFoundError on 404
    // and TransferError on any other status or when the request could not be
    // made. Never retries.
    [[nodiscard]] ResponseStreamPtr fetch(const std::string& url) const;

private:
    const FetcherConfig& config_;
};

// fetch() followed by StreamingReader::download(), reporting progress on `status`.
std::vector<char> downloadWithProgress(const HttpFetcher& fetcher, const std::string& url,
                                       std::ostream& status = std::cerr);

} // namespace streamdl
