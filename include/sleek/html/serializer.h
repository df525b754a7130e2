#pragma once
#include <sleek/html/tree_builder.h>
#include <string>
#include <string_view>

namespace sleek::html {

// Writes the tree back to markup. Text is escaped (& < > and U+00A0),
// attribute values are double-quoted with & and " escaped, raw text element
// content is written verbatim and void elements get no end tag.
std::string serialize(const SimpleNode& node);

} // namespace sleek::html
