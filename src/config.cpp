#include "streamdl/config.hpp"

#include "streamdl/errors.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

#ifndef STREAMDL_VERSION
#define STREAMDL_VERSION "0.0.0"
#endif

namespace streamdl {

std::string defaultUserAgent() {
    return "streamdl/" STREAMDL_VERSION;
}

FetcherConfig makeFetcherConfig(const std::optional<std::string>& cert_path) {
    FetcherConfig config;
    if (cert_path && !cert_path->empty()) {
        config.root_certificate = loadRootCertificate(*cert_path);
    }
    return config;
}

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine cmd;
    int arg_index = 1;

    while (arg_index < argc && argv[arg_index][0] == '-' && argv[arg_index][1] != '\0') {
        const std::string option = argv[arg_index];

        if (option == "-o" || option == "--output") {
            if (arg_index + 1 >= argc) {
                throw UsageError("Missing value for " + option);
            }
            cmd.output = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "--cert") {
            if (arg_index + 1 >= argc) {
                throw UsageError("Missing value for " + option);
            }
            cmd.cert_path = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "-v" || option == "--verbose") {
            cmd.verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            cmd.show_help = true;
            return cmd;
        } else if (option == "--") {
            ++arg_index;
            break;
        } else {
            throw UsageError("Unknown option: " + option);
        }
    }

    if (argc - arg_index != 1) {
        throw UsageError("Expected exactly one URL");
    }
    cmd.url = argv[arg_index];

    if (!cmd.cert_path) {
        if (const char* env = std::getenv("STREAMDL_CERT"); env && *env) {
            cmd.cert_path = env;
        }
    }

    return cmd;
}

void printUsage(const char* program_name) {
    fmt::print(stderr, "Usage: {} [-o <file>] [--cert <pem>] [-v] <url>\n", program_name);
    fmt::print(stderr,
               "Options:\n"
               "  -o, --output <file>  Write the body to <file> (default: stdout)\n"
               "  --cert <pem>         Extra root certificate (default: $STREAMDL_CERT)\n"
               "  -v, --verbose        Print diagnostic messages\n"
               "  -h, --help           Show this message\n");
}

} // namespace streamdl
