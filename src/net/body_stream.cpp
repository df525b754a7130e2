#include <sleek/net/body_stream.h>
#include <algorithm>

namespace sleek::net {

// ---------------------------------------------------------------------------
// MemoryBodyStream
// ---------------------------------------------------------------------------

MemoryBodyStream::MemoryBodyStream(std::vector<uint8_t> data, size_t chunk_size)
    : data_(std::move(data)), chunk_size_(std::max<size_t>(chunk_size, 1)) {}

MemoryBodyStream::MemoryBodyStream(const std::string& data, size_t chunk_size)
    : data_(data.begin(), data.end()), chunk_size_(std::max<size_t>(chunk_size, 1)) {}

std::optional<std::vector<uint8_t>> MemoryBodyStream::read() {
    if (pos_ >= data_.size()) {
        return std::vector<uint8_t>{};
    }
    size_t n = std::min(chunk_size_, data_.size() - pos_);
    std::vector<uint8_t> chunk(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                               data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return chunk;
}

// ---------------------------------------------------------------------------
// drain
// ---------------------------------------------------------------------------

DrainResult drain(BodyStream& stream, size_t limit) {
    DrainResult result;
    while (true) {
        auto chunk = stream.read();
        if (!chunk.has_value()) {
            result.error = stream.error();
            if (result.error.empty()) result.error = "body read failed";
            return result;
        }
        if (chunk->empty()) {
            result.ok = true;
            return result;
        }
        if (result.data.size() + chunk->size() > limit) {
            result.too_large = true;
            result.error = "body exceeds " + std::to_string(limit) + " bytes";
            return result;
        }
        result.data.insert(result.data.end(), chunk->begin(), chunk->end());
    }
}

// ---------------------------------------------------------------------------
// ChunkedDecoder
// ---------------------------------------------------------------------------

namespace {

int hex_value(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr uint64_t kMaxChunkSize = uint64_t{1} << 40;

} // anonymous namespace

void ChunkedDecoder::end_size_line() {
    if (chunk_size_ == 0) {
        state_ = State::Trailer;
        trailer_line_has_content_ = false;
    } else {
        remaining_ = chunk_size_;
        state_ = State::Data;
    }
}

bool ChunkedDecoder::feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out) {
    size_t i = 0;
    while (i < len && state_ != State::Done) {
        uint8_t c = data[i];
        switch (state_) {
            case State::Size: {
                int v = hex_value(c);
                if (v >= 0) {
                    chunk_size_ = chunk_size_ * 16 + static_cast<uint64_t>(v);
                    if (chunk_size_ > kMaxChunkSize) return false;
                    have_digit_ = true;
                } else if (!have_digit_) {
                    return false;
                } else if (c == ';' || c == ' ' || c == '\t') {
                    state_ = State::Extension;
                } else if (c == '\r') {
                    state_ = State::SizeLF;
                } else if (c == '\n') {
                    end_size_line();
                } else {
                    return false;
                }
                ++i;
                break;
            }
            case State::Extension:
                if (c == '\r') {
                    state_ = State::SizeLF;
                } else if (c == '\n') {
                    end_size_line();
                }
                ++i;
                break;
            case State::SizeLF:
                if (c != '\n') return false;
                end_size_line();
                ++i;
                break;
            case State::Data: {
                size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, len - i));
                out.insert(out.end(), data + i, data + i + n);
                remaining_ -= n;
                i += n;
                if (remaining_ == 0) state_ = State::DataCR;
                break;
            }
            case State::DataCR:
                if (c == '\r') {
                    state_ = State::DataLF;
                } else if (c == '\n') {
                    state_ = State::Size;
                    chunk_size_ = 0;
                    have_digit_ = false;
                } else {
                    return false;
                }
                ++i;
                break;
            case State::DataLF:
                if (c != '\n') return false;
                state_ = State::Size;
                chunk_size_ = 0;
                have_digit_ = false;
                ++i;
                break;
            case State::Trailer:
                if (c == '\n') {
                    if (!trailer_line_has_content_) {
                        state_ = State::Done;
                    }
                    trailer_line_has_content_ = false;
                } else if (c != '\r') {
                    trailer_line_has_content_ = true;
                }
                ++i;
                break;
            case State::Done:
                break;
        }
    }
    return true;
}

} // namespace sleek::net
