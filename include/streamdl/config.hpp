#pragma once

#include "certificate.hpp"
#include "proxy.hpp"

#include <optional>
#include <string>

namespace streamdl {

std::string defaultUserAgent();

// Everything a fetcher needs that is decided once per process.
struct FetcherConfig {
    std::string user_agent{defaultUserAgent()};
    std::optional<Certificate> root_certificate;
    ProxyResolver proxies;
};

// Reads the optional custom root certificate once; a certificate that cannot
// be loaded is dropped and the default trust store applies.
FetcherConfig makeFetcherConfig(const std::optional<std::string>& cert_path);

struct CommandLine {
    std::string url;
    std::optional<std::string> output;     // stdout when empty
    std::optional<std::string> cert_path;  // --cert, else $STREAMDL_CERT
    bool verbose{false};
    bool show_help{false};
};

// Throws UsageError on malformed arguments.
CommandLine parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* program_name);

} // namespace streamdl
