#include "streamdl/config.hpp"
#include "streamdl/detail/curl_utils.hpp"
#include "streamdl/errors.hpp"
#include "streamdl/http_fetcher.hpp"
#include "streamdl/log.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum ExitCode : int {
    kSuccess = 0,
    kFailure = 1,
    kNotFound = 2,
    kTransferFailed = 3,
    kIoFailed = 4,
};

void writeOutput(const std::vector<char>& body, const std::optional<std::string>& output) {
    if (!output || *output == "-") {
        std::cout.write(body.data(), static_cast<std::streamsize>(body.size()));
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Failed to write to stdout");
        }
        return;
    }

    std::ofstream file(*output, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot create destination file: " + *output);
    }
    file.write(body.data(), static_cast<std::streamsize>(body.size()));
    if (!file) {
        throw std::runtime_error("Failed to write destination file: " + *output);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        const streamdl::CommandLine cmd = streamdl::parseCommandLine(argc, argv);
        if (cmd.show_help) {
            streamdl::printUsage(argv[0]);
            return kSuccess;
        }
        streamdl::setVerbose(cmd.verbose);

        streamdl::detail::ensureCurlInitialized();

        // Loaded once; the fetcher only ever sees this object.
        const streamdl::FetcherConfig config = streamdl::makeFetcherConfig(cmd.cert_path);
        if (cmd.cert_path) {
            if (config.root_certificate) {
                streamdl::logInfo("Trusting extra root certificate {}", config.root_certificate->subject());
            } else {
                streamdl::logInfo("Ignoring unusable certificate {}", *cmd.cert_path);
            }
        }

        const streamdl::HttpFetcher fetcher(config);
        const std::vector<char> body = streamdl::downloadWithProgress(fetcher, cmd.url);
        writeOutput(body, cmd.output);
        streamdl::logInfo("Downloaded {} bytes", body.size());
    } catch (const streamdl::UsageError& ex) {
        streamdl::logError(ex.what());
        streamdl::printUsage(argv[0]);
        return kFailure;
    } catch (const streamdl::NotFoundError& ex) {
        streamdl::logError(ex.what());
        return kNotFound;
    } catch (const streamdl::TransferError& ex) {
        streamdl::logError(ex.what());
        return kTransferFailed;
    } catch (const streamdl::IoError& ex) {
        streamdl::logError(ex.what());
        return kIoFailed;
    } catch (const std::exception& ex) {
        streamdl::logError(std::string{"Fatal error: "} + ex.what());
        return kFailure;
    }
    return kSuccess;
}
