#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sleek::net {

enum class ContentCoding { Identity, Gzip, Deflate, Unsupported };

// Maps a Content-Encoding header value. Stacked codings are Unsupported.
ContentCoding parse_content_coding(const std::string& header_value);

struct DecodeResult {
    bool ok = false;
    bool too_large = false;
    std::vector<uint8_t> data;
    std::string error;
};

// Undoes the coding with zlib. Inflation stops with too_large as soon as the
// output would grow past `max_output` bytes, so the decoded size is bounded
// no matter how well the input compresses.
DecodeResult decode_body(const std::vector<uint8_t>& body, ContentCoding coding,
                         size_t max_output);

} // namespace sleek::net
