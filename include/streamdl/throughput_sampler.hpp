#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace streamdl {

// Sliding window over the byte counts of the last few finished seconds.
class ThroughputSampler {
public:
    static constexpr std::size_t kWindowSize = 5;

    // Counts bytes towards the second currently in progress.
    void record(std::uint64_t bytes) noexcept;

    // Closes the current second: its byte count becomes the newest sample,
    // evicting the oldest one once the window is full.
    void commit();

    // Average of the window. With no samples yet, `fallback` (typically the
    // advertised content length) or 0.
    [[nodiscard]] std::uint64_t speed(std::optional<std::uint64_t> fallback) const noexcept;

    // Most recent first.
    [[nodiscard]] const std::deque<std::uint64_t>& samples() const noexcept { return samples_; }
    [[nodiscard]] std::uint64_t inProgress() const noexcept { return in_progress_; }

private:
    std::deque<std::uint64_t> samples_;
    std::uint64_t in_progress_{0};
};

} // namespace streamdl
