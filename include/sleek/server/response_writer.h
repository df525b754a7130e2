#pragma once

#include <sleek/proxy/proxy_handler.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace sleek::server {

// Destination for response bytes; false means the caller went away.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(std::string_view bytes) = 0;
};

class StringSink : public ByteSink {
public:
    bool write(std::string_view bytes) override {
        data_.append(bytes);
        return true;
    }
    const std::string& data() const { return data_; }

private:
    std::string data_;
};

enum class WriteResult {
    Complete,
    ClientGone,      // a write failed; the upstream stream was dropped
    UpstreamFailed,  // the body stream failed after the head went out
};

struct WriteSummary {
    WriteResult result = WriteResult::Complete;
    uint64_t body_bytes = 0;
    std::string error;
};

const char* status_reason(int status);

// Writes status line, headers and body with Connection: close. Streams are
// framed by Content-Length when known, otherwise chunked (HTTP/1.1) or by
// closing the connection (HTTP/1.0).
WriteSummary write_response(ByteSink& sink, proxy::ProxyResponse& response, bool head_only,
                            bool allow_chunked);

} // namespace sleek::server
