#pragma once

#include "response_stream.hpp"
#include "progress_renderer.hpp"
#include "throughput_sampler.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <vector>

namespace streamdl {

struct TransferState {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::uint64_t total_downloaded{0};
    ThroughputSampler sampler;
    TimePoint start_time{};
    std::optional<TimePoint> last_tick;
};

// Reads a response body to the end while keeping a status line with the
// transfer statistics up to date. The line is refreshed once per second.
class StreamingReader {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::size_t kChunkSize = 8192;
    // Upper bound on the up-front reservation taken from the advertised length.
    static constexpr std::size_t kMaxReserve = 64 * 1024 * 1024;

    StreamingReader(ResponseStream& stream, std::ostream& status = std::cerr,
                    Clock clock = &std::chrono::steady_clock::now);

    // Returns the whole body. Reads failing with std::errc::interrupted are
    // retried; any other IoError propagates and leaves the status line as is.
    std::vector<char> download();

    [[nodiscard]] const TransferState& state() const noexcept { return state_; }

private:
    void tick();
    void display();

    ResponseStream& stream_;
    ProgressRenderer renderer_;
    Clock clock_;
    std::optional<std::uint64_t> content_length_;
    TransferState state_;
};

} // namespace streamdl
