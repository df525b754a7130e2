#pragma once

#include <sleek/net/header_map.h>

#include <string_view>

namespace sleek::proxy {

// Page policies and cookies never reach the caller. Hop-by-hop and framing
// headers are dropped because the body is re-framed.
bool is_denied_response_header(std::string_view name);

net::HeaderMap sanitize_response_headers(const net::HeaderMap& upstream);

} // namespace sleek::proxy
