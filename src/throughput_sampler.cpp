#include "streamdl/throughput_sampler.hpp"

#include <numeric>

namespace streamdl {

void ThroughputSampler::record(std::uint64_t bytes) noexcept {
    in_progress_ += bytes;
}

void ThroughputSampler::commit() {
    if (samples_.size() == kWindowSize) {
        samples_.pop_back();
    }
    samples_.push_front(in_progress_);
    in_progress_ = 0;
}

std::uint64_t ThroughputSampler::speed(std::optional<std::uint64_t> fallback) const noexcept {
    if (samples_.empty()) {
        return fallback.value_or(0);
    }
    const std::uint64_t sum = std::accumulate(samples_.begin(), samples_.end(), std::uint64_t{0});
    return sum / samples_.size();
}

} // namespace streamdl
