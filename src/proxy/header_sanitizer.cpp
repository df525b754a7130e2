#include <sleek/proxy/header_sanitizer.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace sleek::proxy {
namespace {

constexpr std::array<std::string_view, 6> kPolicyHeaders = {
    "content-security-policy",
    "content-security-policy-report-only",
    "x-frame-options",
    "set-cookie",
    "set-cookie2",
    "strict-transport-security",
};

constexpr std::array<std::string_view, 9> kHopByHopHeaders = {
    "connection",
    "keep-alive",
    "proxy-authenticate",
    "proxy-authorization",
    "te",
    "trailer",
    "transfer-encoding",
    "upgrade",
    "content-length",
};

} // namespace

bool is_denied_response_header(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto listed = [&lower](std::string_view entry) { return entry == lower; };
    return std::any_of(kPolicyHeaders.begin(), kPolicyHeaders.end(), listed) ||
           std::any_of(kHopByHopHeaders.begin(), kHopByHopHeaders.end(), listed);
}

net::HeaderMap sanitize_response_headers(const net::HeaderMap& upstream) {
    // Names listed in Connection are hop-by-hop for this message too
    std::vector<std::string> connection_tokens;
    for (const auto& value : upstream.get_all("connection")) {
        size_t start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) comma = value.size();
            std::string token = value.substr(start, comma - start);
            token.erase(0, token.find_first_not_of(" \t"));
            token.erase(token.find_last_not_of(" \t") + 1);
            if (!token.empty()) {
                connection_tokens.push_back(net::HeaderMap::normalize_name(token));
            }
            start = comma + 1;
        }
    }

    net::HeaderMap out;
    for (const auto& [name, value] : upstream) {
        if (is_denied_response_header(name)) continue;
        if (std::find(connection_tokens.begin(), connection_tokens.end(), name) !=
            connection_tokens.end()) {
            continue;
        }
        out.append(name, value);
    }
    return out;
}

} // namespace sleek::proxy
