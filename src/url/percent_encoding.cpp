#include <sleek/url/percent_encoding.h>
#include <cctype>
#include <cstdint>

namespace sleek::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

// Characters that are unreserved and never percent-encoded
bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_component_mark(char c) {
    return c == '!' || c == '*' || c == '\'' || c == '(' || c == ')';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

void append_escaped(std::string& out, unsigned char c) {
    out += '%';
    out += hex_digits[(c >> 4) & 0xF];
    out += hex_digits[c & 0xF];
}

} // anonymous namespace

std::string encode_uri_component(std::string_view input) {
    std::string result;
    result.reserve(input.size() + input.size() / 2);

    for (unsigned char c : input) {
        if (is_unreserved(static_cast<char>(c)) || is_component_mark(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else {
            append_escaped(result, c);
        }
    }

    return result;
}

std::string percent_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += input[i];
    }

    return result;
}

std::string decode_query_component(std::string_view input) {
    std::string plus_decoded(input);
    for (char& c : plus_decoded) {
        if (c == '+') c = ' ';
    }
    return percent_decode(plus_decoded);
}

std::optional<std::string> find_query_parameter(std::string_view query, std::string_view name) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos) amp = query.size();
        std::string_view pair = query.substr(pos, amp - pos);

        auto eq = pair.find('=');
        std::string_view key = eq == std::string_view::npos ? pair : pair.substr(0, eq);
        if (!pair.empty() && decode_query_component(key) == name) {
            if (eq == std::string_view::npos) return std::string{};
            return decode_query_component(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

} // namespace sleek::url
