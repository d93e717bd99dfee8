#include "streamdl/log.hpp"

#include <atomic>
#include <cstdio>

namespace streamdl {

namespace {
std::atomic<bool> g_verbose{false};
}

void setVerbose(bool verbose) noexcept {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool isVerbose() noexcept {
    return g_verbose.load(std::memory_order_relaxed);
}

void logInfo(std::string_view msg) {
    if (isVerbose()) {
        fmt::print(stderr, "[info] {}\n", msg);
    }
}

void logError(std::string_view msg) {
    fmt::print(stderr, "[error] {}\n", msg);
}

} // namespace streamdl
