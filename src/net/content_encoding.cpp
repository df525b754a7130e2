#include <sleek/net/content_encoding.h>
#include <algorithm>
#include <cctype>
#include <zlib.h>

namespace sleek::net {

namespace {

std::string normalize_coding(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (c == ' ' || c == '\t') continue;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

enum class InflateStatus { Ok, Corrupt, TooLarge };

// Inflate with a specific windowBits setting, never holding more than
// max_output bytes of output.
InflateStatus try_inflate(const std::vector<uint8_t>& compressed, int window_bits,
                          size_t max_output, std::vector<uint8_t>& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return InflateStatus::Corrupt;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    output.clear();
    output.reserve(std::min(compressed.size() * 4, max_output));

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            inflateEnd(&strm);
            return InflateStatus::Corrupt;
        }
        if (ret == Z_BUF_ERROR) {
            // Input exhausted before stream end
            inflateEnd(&strm);
            return InflateStatus::Corrupt;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        if (have > max_output - output.size()) {
            inflateEnd(&strm);
            output.clear();
            output.shrink_to_fit();
            return InflateStatus::TooLarge;
        }
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return InflateStatus::Ok;
}

} // anonymous namespace

ContentCoding parse_content_coding(const std::string& header_value) {
    std::string coding = normalize_coding(header_value);
    if (coding.empty() || coding == "identity") return ContentCoding::Identity;
    if (coding == "gzip" || coding == "x-gzip") return ContentCoding::Gzip;
    if (coding == "deflate") return ContentCoding::Deflate;
    return ContentCoding::Unsupported;
}

DecodeResult decode_body(const std::vector<uint8_t>& body, ContentCoding coding,
                         size_t max_output) {
    DecodeResult result;
    switch (coding) {
        case ContentCoding::Identity:
            if (body.size() > max_output) {
                result.too_large = true;
                result.error = "document exceeds " + std::to_string(max_output) + " bytes";
                return result;
            }
            result.ok = true;
            result.data = body;
            return result;
        case ContentCoding::Unsupported:
            result.error = "unsupported content coding";
            return result;
        case ContentCoding::Gzip:
        case ContentCoding::Deflate:
            break;
    }

    if (body.empty()) {
        result.ok = true;
        return result;
    }

    // 15 + 32 enables automatic gzip / zlib-wrapped deflate detection
    InflateStatus status = try_inflate(body, 15 + 32, max_output, result.data);

    // Some servers send raw deflate under Content-Encoding: deflate
    if (status == InflateStatus::Corrupt && coding == ContentCoding::Deflate) {
        status = try_inflate(body, -15, max_output, result.data);
    }

    switch (status) {
        case InflateStatus::Ok:
            result.ok = true;
            break;
        case InflateStatus::TooLarge:
            result.too_large = true;
            result.error = "document exceeds " + std::to_string(max_output) +
                           " bytes after decoding";
            break;
        case InflateStatus::Corrupt:
            result.data.clear();
            result.error = "corrupt compressed body";
            break;
    }
    return result;
}

} // namespace sleek::net
