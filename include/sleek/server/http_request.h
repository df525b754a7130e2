#pragma once

#include <sleek/net/header_map.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sleek::server {

struct HttpRequest {
    std::string method;
    std::string target;  // request-target as sent
    std::string path;    // percent-decoded, no query
    std::string query;   // raw, without '?'
    std::string version;
    net::HeaderMap headers;
    std::string client_address;

    // Decoded value of a query parameter
    std::optional<std::string> query_parameter(std::string_view name) const;
};

enum class ParseStatus {
    Complete,
    Incomplete,
    Invalid,
    TooLarge,
};

inline constexpr size_t kMaxRequestHeadBytes = 16 * 1024;

// Parses an inbound request head from the start of `data`. On Complete,
// `consumed` is the length of the head including the blank line.
ParseStatus parse_request_head(std::string_view data, HttpRequest& out, size_t& consumed);

} // namespace sleek::server
