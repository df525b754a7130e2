#include <sleek/net/request.h>
#include <sleek/url/url.h>
#include <sstream>

namespace sleek::net {

std::string method_to_string(Method method) {
    switch (method) {
        case Method::GET:  return "GET";
        case Method::HEAD: return "HEAD";
    }
    return "GET";
}

bool Request::parse_url() {
    auto parsed = sleek::url::parse(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https") ||
        parsed->host.empty()) {
        return false;
    }
    host = parsed->host;
    use_tls = (parsed->scheme == "https");
    port = parsed->effective_port();
    path = parsed->path.empty() ? "/" : parsed->path;
    query = parsed->query;
    return true;
}

std::vector<uint8_t> Request::serialize() const {
    std::ostringstream oss;

    // Request line
    oss << method_to_string(method) << " " << path;
    if (!query.empty()) {
        oss << "?" << query;
    }
    oss << " HTTP/1.1\r\n";

    // Host header (always first)
    oss << "Host: " << host;
    if (port != (use_tls ? 443 : 80)) {
        oss << ":" << port;
    }
    oss << "\r\n";

    // One request per connection; the body ends at close if unframed
    oss << "Connection: close\r\n";

    if (!headers.has("accept")) {
        oss << "Accept: text/html,application/xhtml+xml,*/*;q=0.8\r\n";
    }

    // Only encodings the content decoder understands
    if (!headers.has("accept-encoding")) {
        oss << "Accept-Encoding: gzip, deflate\r\n";
    }

    if (!headers.has("accept-language")) {
        oss << "Accept-Language: en-US,en;q=0.9\r\n";
    }

    // User-supplied headers
    for (const auto& [name, value] : headers) {
        if (name == "host" || name == "connection") {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }

    // End of headers
    oss << "\r\n";

    std::string header_str = oss.str();
    return std::vector<uint8_t>(header_str.begin(), header_str.end());
}

} // namespace sleek::net
