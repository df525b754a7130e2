#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace sleek::url {

// Lowercases an ASCII domain and rejects forbidden host code points.
// Non-ASCII labels are rejected rather than punycode-converted.
std::optional<std::string> domain_to_ascii(std::string_view domain);

bool is_forbidden_host_code_point(char c);

} // namespace sleek::url
