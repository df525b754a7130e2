#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::core {

// Standard alphabet with '=' padding, no line breaks.
std::string base64_encode(const std::vector<uint8_t>& data);

// Padded input only. '=' may appear solely as the last one or two characters.
std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

} // namespace sleek::core
