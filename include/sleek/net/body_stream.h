#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sleek::net {

// Incremental response body. Same convention as TlsSocket::recv():
// a non-empty chunk, an empty vector once the body is complete, or
// std::nullopt on failure with the reason in error().
class BodyStream {
public:
    virtual ~BodyStream() = default;

    virtual std::optional<std::vector<uint8_t>> read() = 0;
    virtual std::string error() const = 0;
};

class MemoryBodyStream : public BodyStream {
public:
    explicit MemoryBodyStream(std::vector<uint8_t> data, size_t chunk_size = 16384);
    explicit MemoryBodyStream(const std::string& data, size_t chunk_size = 16384);

    std::optional<std::vector<uint8_t>> read() override;
    std::string error() const override { return {}; }

private:
    std::vector<uint8_t> data_;
    size_t chunk_size_;
    size_t pos_ = 0;
};

struct DrainResult {
    bool ok = false;
    bool too_large = false;
    std::vector<uint8_t> data;
    std::string error;
};

// Reads the whole stream, failing once more than `limit` bytes arrive.
DrainResult drain(BodyStream& stream, size_t limit);

// Incremental decoder for Transfer-Encoding: chunked.
class ChunkedDecoder {
public:
    // Consumes raw bytes and appends payload to `out`. Returns false on
    // malformed framing. Bytes after the final chunk are ignored.
    bool feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out);
    bool done() const { return state_ == State::Done; }

private:
    enum class State { Size, Extension, SizeLF, Data, DataCR, DataLF, Trailer, Done };
    State state_ = State::Size;
    uint64_t chunk_size_ = 0;
    uint64_t remaining_ = 0;
    bool have_digit_ = false;
    bool trailer_line_has_content_ = false;

    void end_size_line();
};

} // namespace sleek::net
