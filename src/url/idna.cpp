#include <sleek/url/idna.h>
#include <algorithm>
#include <cctype>

namespace sleek::url {

bool is_forbidden_host_code_point(char c) {
    switch (c) {
        case '\0': case '\t': case '\n': case '\r': case ' ':
        case '#': case '/': case ':': case '<': case '>': case '?':
        case '@': case '[': case '\\': case ']': case '^': case '|':
        case '%':
            return true;
        default:
            return false;
    }
}

std::optional<std::string> domain_to_ascii(std::string_view domain) {
    if (domain.empty()) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(domain.size());

    for (char c : domain) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc > 127) {
            return std::nullopt;
        }
        if (uc < 0x20 || uc == 0x7F) {
            return std::nullopt;
        }
        if (is_forbidden_host_code_point(c)) {
            return std::nullopt;
        }
        result += static_cast<char>(std::tolower(uc));
    }

    // A trailing dot is a fully-qualified spelling of the same host
    if (result.back() == '.' && result.size() > 1) {
        result.pop_back();
    }

    if (result.empty() || result == "." ||
        result.find("..") != std::string::npos || result.front() == '.') {
        return std::nullopt;
    }

    return result;
}

} // namespace sleek::url
