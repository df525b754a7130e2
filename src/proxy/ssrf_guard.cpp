#include <sleek/proxy/ssrf_guard.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace sleek::proxy {
namespace {

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string strip_brackets(std::string host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool is_private_ipv4(uint8_t a, uint8_t b) {
    if (a == 10) return true;                           // 10.0.0.0/8
    if (a == 172 && b >= 16 && b <= 31) return true;    // 172.16.0.0/12
    if (a == 192 && b == 168) return true;              // 192.168.0.0/16
    if (a == 127) return true;                          // 127.0.0.0/8
    if (a == 169 && b == 254) return true;              // 169.254.0.0/16
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// Address classification
// ---------------------------------------------------------------------------

bool is_private_address(std::string_view ip) {
    std::string text = strip_brackets(std::string(ip));

    std::array<uint8_t, 4> v4{};
    if (::inet_pton(AF_INET, text.c_str(), v4.data()) == 1) {
        return is_private_ipv4(v4[0], v4[1]);
    }

    std::array<uint8_t, 16> v6{};
    if (::inet_pton(AF_INET6, text.c_str(), v6.data()) != 1) {
        return true;  // unparsable: fail closed
    }

    // ::ffff:a.b.c.d carries an IPv4 address
    static constexpr std::array<uint8_t, 12> kMappedPrefix{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    if (std::equal(kMappedPrefix.begin(), kMappedPrefix.end(), v6.begin())) {
        return is_private_ipv4(v6[12], v6[13]);
    }

    static constexpr std::array<uint8_t, 16> kLoopback{0, 0, 0, 0, 0, 0, 0, 0,
                                                       0, 0, 0, 0, 0, 0, 0, 1};
    if (v6 == kLoopback) return true;                   // ::1
    if (v6[0] == 0xfe && v6[1] == 0x80) return true;    // fe80 prefix
    if (v6[0] == 0xfc || v6[0] == 0xfd) return true;    // fc00::/7
    return false;
}

// ---------------------------------------------------------------------------
// SystemResolver
// ---------------------------------------------------------------------------

std::optional<std::vector<std::string>> SystemResolver::resolve(const std::string& host) const {
    std::string name = strip_brackets(host);
    if (name.empty()) return std::nullopt;

    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int rv = ::getaddrinfo(name.c_str(), nullptr, &hints, &result);
    if (rv != 0 || result == nullptr) {
        return std::nullopt;
    }

    std::vector<std::string> addresses;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {};
        const void* src = nullptr;
        if (rp->ai_family == AF_INET) {
            src = &reinterpret_cast<const struct sockaddr_in*>(rp->ai_addr)->sin_addr;
        } else if (rp->ai_family == AF_INET6) {
            src = &reinterpret_cast<const struct sockaddr_in6*>(rp->ai_addr)->sin6_addr;
        } else {
            continue;
        }
        if (::inet_ntop(rp->ai_family, src, buf, sizeof(buf)) == nullptr) continue;
        std::string address(buf);
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(std::move(address));
        }
    }
    ::freeaddrinfo(result);
    return addresses;
}

// ---------------------------------------------------------------------------
// SsrfGuard
// ---------------------------------------------------------------------------

SsrfGuard::SsrfGuard(std::vector<std::string> allowed_hosts, bool block_private_addresses,
                     std::shared_ptr<const HostResolver> resolver)
    : block_private_addresses_(block_private_addresses), resolver_(std::move(resolver)) {
    for (auto& host : allowed_hosts) {
        allowed_hosts_.push_back(to_lower_ascii(strip_brackets(std::move(host))));
    }
    if (!resolver_) {
        resolver_ = std::make_shared<SystemResolver>();
    }
}

bool SsrfGuard::is_allowlisted(const std::string& hostname) const {
    if (allowed_hosts_.empty()) return true;
    std::string host = to_lower_ascii(strip_brackets(hostname));
    return std::find(allowed_hosts_.begin(), allowed_hosts_.end(), host) != allowed_hosts_.end();
}

HostDecision SsrfGuard::authorize(const std::string& hostname) const {
    HostDecision decision;

    if (!is_allowlisted(hostname)) {
        decision.reason = DenyReason::NotAllowlisted;
        decision.message = "Host not allowed: " + hostname;
        return decision;
    }

    if (!block_private_addresses_) {
        decision.allowed = true;
        return decision;
    }

    auto addresses = resolver_->resolve(strip_brackets(hostname));
    if (!addresses || addresses->empty()) {
        decision.reason = DenyReason::Unresolvable;
        decision.message = "Could not resolve host: " + hostname;
        return decision;
    }

    for (const auto& address : *addresses) {
        if (is_private_address(address)) {
            decision.reason = DenyReason::PrivateAddress;
            decision.message = "Access to private network addresses is blocked (" +
                               hostname + " resolves to " + address + ")";
            return decision;
        }
    }

    decision.allowed = true;
    decision.addresses = std::move(*addresses);
    return decision;
}

} // namespace sleek::proxy
