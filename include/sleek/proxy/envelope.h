#pragma once

#include <sleek/core/diagnostics.h>
#include <sleek/net/header_map.h>
#include <sleek/proxy/proxy_handler.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::proxy {

// Serverless response shape: {statusCode, headers, body, isBase64Encoded}
struct FunctionEnvelope {
    int status_code = 200;
    net::HeaderMap headers;
    std::string body;
    bool is_base64_encoded = false;

    std::string to_json() const;
};

// Drains a passthrough stream (up to max_body_bytes) and base64-encodes it.
// Passthrough bodies gain Cache-Control: max-age=3600 when upstream sent none.
FunctionEnvelope to_envelope(ProxyResponse&& response, core::DiagnosticEmitter& diag,
                             size_t max_body_bytes = std::numeric_limits<size_t>::max());

} // namespace sleek::proxy
