#include "streamdl/progress_renderer.hpp"

#include "streamdl/units.hpp"

#include <fmt/format.h>

#include <exception>

namespace streamdl {

namespace {

// Number of UTF-8 code points.
std::size_t displayWidth(const std::string& text) {
    std::size_t width = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

} // namespace

std::chrono::seconds estimateRemaining(std::uint64_t downloaded, std::uint64_t content_length,
                                       std::uint64_t speed) noexcept {
    if (speed == 0 || downloaded >= content_length) {
        return std::chrono::seconds{0};
    }
    const std::uint64_t remaining = content_length - downloaded;
    return std::chrono::seconds{static_cast<std::chrono::seconds::rep>(remaining / speed)};
}

std::string formatStatusLine(const TransferSnapshot& snapshot) {
    const std::string total = formatBytes(snapshot.downloaded);
    const std::string speed = formatBytes(snapshot.speed, true);
    const std::string elapsed = formatDuration(snapshot.elapsed);

    if (!snapshot.content_length) {
        return fmt::format("Total: {} Speed: {} Elapsed: {}", total, speed, elapsed);
    }

    const std::uint64_t length = *snapshot.content_length;
    // Not clamped: a server sending more than it advertised shows over 100%.
    const double percent = length > 0
        ? static_cast<double>(snapshot.downloaded) / static_cast<double>(length) * 100.0
        : 100.0;
    const auto eta = estimateRemaining(snapshot.downloaded, length, snapshot.speed);

    return fmt::format("{} / {} ({:3.0f}%) {} in {} ETA: {}",
                       total,
                       formatBytes(length),
                       percent,
                       speed,
                       elapsed,
                       formatDuration(eta));
}

void ProgressRenderer::erase() {
    if (!last_width_) {
        return;
    }
    write(std::string(*last_width_, ' '));
    write("\r");
}

void ProgressRenderer::draw(const std::string& line) {
    write(line);
    last_width_ = displayWidth(line);
}

void ProgressRenderer::carriageReturn() {
    write("\r");
}

void ProgressRenderer::finish() {
    write("\n");
    try {
        out_.flush();
    } catch (const std::exception&) {
    }
    out_.clear();
}

void ProgressRenderer::write(const std::string& text) noexcept {
    // Progress output is best effort; a broken status stream must not fail the download.
    try {
        out_ << text;
    } catch (const std::exception&) {
    }
    out_.clear();
}

} // namespace streamdl
