#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace streamdl {

// A source of response body bytes.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    // Reads up to `size` bytes into `buffer`. Returns 0 at end of stream.
    // Throws IoError on failure.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;

    // Length advertised by the server, if any.
    [[nodiscard]] virtual std::optional<std::uint64_t> contentLength() const = 0;
};

using ResponseStreamPtr = std::unique_ptr<ResponseStream>;

} // namespace streamdl
