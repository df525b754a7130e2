#pragma once
#include <sleek/net/header_map.h>
#include <sleek/net/request.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sleek::net {

// Status line and headers of an upstream response. The body is delivered
// separately as a BodyStream.
struct Response {
    uint16_t status = 0;
    std::string status_text;
    HeaderMap headers;
    std::string url;

    // Parse "HTTP/1.x NNN reason\r\n" followed by header lines. The trailing
    // blank line may be present or not. Obsolete line folding is unfolded.
    static std::optional<Response> parse_head(std::string_view head);

    // Content-Type header value, or empty
    std::string content_type() const;

    // False for HEAD requests and 1xx/204/304 responses
    bool has_body(Method request_method) const;
};

} // namespace sleek::net
