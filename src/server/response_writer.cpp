#include <sleek/server/response_writer.h>

#include <cstdio>

namespace sleek::server {
namespace {

std::string chunk_header(size_t size) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%zx\r\n", size);
    return buf;
}

} // namespace

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

WriteSummary write_response(ByteSink& sink, proxy::ProxyResponse& response, bool head_only,
                            bool allow_chunked) {
    WriteSummary summary;

    // Statuses that never carry a body
    bool bodiless = response.status == 204 || response.status == 304 ||
                    (response.status >= 100 && response.status < 200);
    bool streaming = response.stream != nullptr && !bodiless;
    bool chunked = streaming && !response.content_length && allow_chunked;

    std::string head = "HTTP/1.1 " + std::to_string(response.status) + " " +
                       status_reason(response.status) + "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (name == "connection" || name == "content-length" || name == "transfer-encoding") {
            continue;
        }
        head += name + ": " + value + "\r\n";
    }
    if (!bodiless) {
        if (!streaming) {
            head += "content-length: " + std::to_string(response.body.size()) + "\r\n";
        } else if (response.content_length) {
            head += "content-length: " + std::to_string(*response.content_length) + "\r\n";
        } else if (chunked) {
            head += "transfer-encoding: chunked\r\n";
        }
    }
    head += "connection: close\r\n\r\n";

    if (!sink.write(head)) {
        response.stream.reset();
        summary.result = WriteResult::ClientGone;
        summary.error = "client closed before response head";
        return summary;
    }
    if (head_only || bodiless) {
        response.stream.reset();
        return summary;
    }

    if (!streaming) {
        if (!response.body.empty() && !sink.write(response.body)) {
            summary.result = WriteResult::ClientGone;
            summary.error = "client closed during body";
            return summary;
        }
        summary.body_bytes = response.body.size();
        return summary;
    }

    while (true) {
        auto chunk = response.stream->read();
        if (!chunk) {
            summary.result = WriteResult::UpstreamFailed;
            summary.error = response.stream->error();
            response.stream.reset();
            return summary;
        }
        if (chunk->empty()) break;

        std::string_view bytes(reinterpret_cast<const char*>(chunk->data()), chunk->size());
        bool ok = chunked ? sink.write(chunk_header(bytes.size())) && sink.write(bytes) &&
                                sink.write("\r\n")
                          : sink.write(bytes);
        if (!ok) {
            // Dropping the stream closes the upstream connection
            response.stream.reset();
            summary.result = WriteResult::ClientGone;
            summary.error = "client closed during body";
            return summary;
        }
        summary.body_bytes += bytes.size();
    }
    response.stream.reset();

    if (chunked && !sink.write("0\r\n\r\n")) {
        summary.result = WriteResult::ClientGone;
        summary.error = "client closed before final chunk";
    }
    return summary;
}

} // namespace sleek::server
