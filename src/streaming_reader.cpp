#include "streamdl/streaming_reader.hpp"

#include "streamdl/errors.hpp"

#include <algorithm>
#include <utility>

namespace streamdl {

StreamingReader::StreamingReader(ResponseStream& stream, std::ostream& status, Clock clock)
    : stream_(stream),
      renderer_(status),
      clock_(std::move(clock)),
      content_length_(stream.contentLength()) {
    state_.start_time = clock_();
}

std::vector<char> StreamingReader::download() {
    std::vector<char> buffer(kChunkSize);
    std::vector<char> data;
    // The advertised length is only a hint and may be arbitrarily large.
    data.reserve(content_length_
        ? static_cast<std::size_t>(std::min<std::uint64_t>(*content_length_, kMaxReserve))
        : kChunkSize);

    while (true) {
        std::size_t read = 0;
        try {
            read = stream_.read(buffer.data(), buffer.size());
        } catch (const IoError& e) {
            // Data is not ready yet but will be eventually: keep trying until
            // we get data, the end of the stream or a real error.
            if (e.interrupted()) {
                continue;
            }
            throw;
        }

        if (read == 0) {
            break;
        }

        data.insert(data.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(read));

        const auto now = clock_();
        if (!state_.last_tick) {
            state_.last_tick = now;
        }

        state_.total_downloaded += read;
        state_.sampler.record(read);

        if (now - *state_.last_tick >= std::chrono::seconds{1}) {
            tick();
        }
    }

    display();
    renderer_.finish();

    return data;
}

void StreamingReader::tick() {
    state_.sampler.commit();
    renderer_.erase();
    display();
    renderer_.carriageReturn();
    state_.last_tick = clock_();
}

void StreamingReader::display() {
    TransferSnapshot snapshot;
    snapshot.downloaded = state_.total_downloaded;
    snapshot.content_length = content_length_;
    snapshot.speed = state_.sampler.speed(content_length_);
    snapshot.elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock_() - state_.start_time);
    renderer_.draw(formatStatusLine(snapshot));
}

} // namespace streamdl
