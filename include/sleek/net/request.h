#pragma once
#include <sleek/net/header_map.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sleek::net {

enum class Method {
    GET, HEAD
};

std::string method_to_string(Method method);

struct Request {
    std::string url;
    Method method = Method::GET;
    HeaderMap headers;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
    std::string query;
    bool use_tls = false;

    // Addresses already vetted by the caller. When set, the client connects
    // to exactly these and never resolves `host` itself.
    std::vector<std::string> addresses;

    // Polled while waiting on the network; returning true aborts the fetch.
    std::function<bool()> is_cancelled;

    // Serialize to HTTP/1.1 request bytes
    std::vector<uint8_t> serialize() const;

    // Parse URL into host/port/path/query; false for non-http(s) URLs
    bool parse_url();
};

} // namespace sleek::net
