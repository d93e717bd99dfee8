#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace streamdl {

struct DurationParts {
    std::uint64_t days{0};
    std::uint8_t hours{0};
    std::uint8_t minutes{0};
    std::uint8_t seconds{0};
};

// "  1.5 MiB", " 12 B", "  3.0 KiB/s" ...
std::string formatBytes(std::uint64_t bytes, bool per_second = false);

DurationParts splitDuration(std::uint64_t total_seconds);

// Most significant zero components are dropped: "42s", " 1m  5s", " 2h  0m  9s".
std::string formatDuration(std::chrono::seconds duration);

} // namespace streamdl
