#include "streamdl/units.hpp"

#include <fmt/format.h>

namespace streamdl {

std::string formatBytes(std::uint64_t bytes, bool per_second) {
    constexpr double KiB = 1024.0;
    constexpr double MiB = KiB * 1024.0;
    constexpr double GiB = MiB * 1024.0;

    const char* suffix = per_second ? "/s" : "";
    const double value = static_cast<double>(bytes);
    if (value >= GiB) {
        return fmt::format("{:5.1f} GiB{}", value / GiB, suffix);
    } else if (value >= MiB) {
        return fmt::format("{:5.1f} MiB{}", value / MiB, suffix);
    } else if (value >= KiB) {
        return fmt::format("{:5.1f} KiB{}", value / KiB, suffix);
    } else {
        return fmt::format("{:3} B{}", bytes, suffix);
    }
}

DurationParts splitDuration(std::uint64_t total_seconds) {
    DurationParts parts;
    const std::uint64_t minutes = total_seconds / 60;
    const std::uint64_t hours = minutes / 60;
    parts.seconds = static_cast<std::uint8_t>(total_seconds % 60);
    parts.minutes = static_cast<std::uint8_t>(minutes % 60);
    parts.hours = static_cast<std::uint8_t>(hours % 24);
    parts.days = hours / 24;
    return parts;
}

std::string formatDuration(std::chrono::seconds duration) {
    const auto count = duration.count() > 0 ? static_cast<std::uint64_t>(duration.count()) : 0;
    const DurationParts p = splitDuration(count);

    const unsigned h = p.hours;
    const unsigned m = p.minutes;
    const unsigned s = p.seconds;

    if (p.days > 0) {
        return fmt::format("{:3}d {:2}h {:2}m {:2}s", p.days, h, m, s);
    } else if (h > 0) {
        return fmt::format("{:2}h {:2}m {:2}s", h, m, s);
    } else if (m > 0) {
        return fmt::format("{:2}m {:2}s", m, s);
    } else {
        return fmt::format("{:2}s", s);
    }
}

} // namespace streamdl
