#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace sleek::url {

std::string percent_decode(std::string_view input);

// Same unescaped set as ECMAScript encodeURIComponent: alphanumerics and
// - _ . ! ~ * ' ( ). The result is safe as a single query parameter value.
std::string encode_uri_component(std::string_view input);

// application/x-www-form-urlencoded component: '+' is a space.
std::string decode_query_component(std::string_view input);

// Finds the first `name=value` pair in a raw query string (no leading '?')
// and returns the decoded value. A bare `name` yields an empty string.
std::optional<std::string> find_query_parameter(std::string_view query, std::string_view name);

} // namespace sleek::url
