#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace streamdl {

struct TransferSnapshot {
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> content_length;
    std::uint64_t speed{0};  // bytes per second
    std::chrono::seconds elapsed{0};
};

// One status line, e.g.
//   " 12.0 KiB /  1.0 MiB (  1%)   4.0 KiB/s in  3s ETA:  4m 13s"
//   "Total:  12.0 KiB Speed:   4.0 KiB/s Elapsed:  3s"
std::string formatStatusLine(const TransferSnapshot& snapshot);

// Seconds left at the current speed. Zero when the speed is unknown or the
// advertised length has already been reached.
std::chrono::seconds estimateRemaining(std::uint64_t downloaded, std::uint64_t content_length,
                                       std::uint64_t speed) noexcept;

// Keeps a single status line up to date on a terminal stream.
//
// A failing status stream never affects the caller: every write discards
// the stream's exceptions and clears its state.
class ProgressRenderer {
public:
    explicit ProgressRenderer(std::ostream& out) : out_(out) {}

    // Blanks the previously drawn line and returns to column 0.
    void erase();
    void draw(const std::string& line);
    void carriageReturn();
    // Ends the status line with a newline.
    void finish();

    [[nodiscard]] std::optional<std::size_t> lastWidth() const noexcept { return last_width_; }

private:
    void write(const std::string& text) noexcept;

    std::ostream& out_;
    std::optional<std::size_t> last_width_;
};

} // namespace streamdl
