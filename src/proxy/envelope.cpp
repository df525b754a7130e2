#include <sleek/proxy/envelope.h>

#include <sleek/core/base64.h>

#include <cstdio>

namespace sleek::proxy {
namespace {

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (unsigned char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

} // namespace

std::string FunctionEnvelope::to_json() const {
    std::string out = "{\"statusCode\":";
    out += std::to_string(status_code);
    out += ",\"headers\":{";
    bool first = true;
    for (const auto& [name, value] : headers) {
        if (!first) out += ',';
        first = false;
        append_json_string(out, name);
        out += ':';
        append_json_string(out, value);
    }
    out += "},\"body\":";
    append_json_string(out, body);
    out += ",\"isBase64Encoded\":";
    out += is_base64_encoded ? "true" : "false";
    out += '}';
    return out;
}

FunctionEnvelope to_envelope(ProxyResponse&& response, core::DiagnosticEmitter& diag,
                             size_t max_body_bytes) {
    FunctionEnvelope envelope;
    envelope.status_code = response.status;
    envelope.headers = std::move(response.headers);

    if (!response.stream) {
        envelope.body = std::move(response.body);
        response.transaction.advance(TransactionStage::Responded, "envelope");
        return envelope;
    }

    net::DrainResult drained = net::drain(*response.stream, max_body_bytes);
    response.stream.reset();
    if (!drained.ok) {
        const std::string message = "Upstream body error: " + drained.error;
        diag.error("envelope", "responded", message);
        envelope.status_code = 502;
        envelope.headers = net::HeaderMap();
        envelope.headers.set("Content-Type", "text/plain; charset=utf-8");
        envelope.body = message;
        return envelope;
    }

    envelope.body = core::base64_encode(drained.data);
    envelope.is_base64_encoded = true;
    if (!envelope.headers.has("cache-control")) {
        envelope.headers.set("Cache-Control", "max-age=3600");
    }
    response.transaction.advance(TransactionStage::Responded,
                                 std::to_string(drained.data.size()) + " bytes");
    return envelope;
}

} // namespace sleek::proxy
