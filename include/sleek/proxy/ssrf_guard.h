#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::proxy {

// Name resolution seam. Tests inject a table; production uses getaddrinfo.
class HostResolver {
public:
    virtual ~HostResolver() = default;

    // Every address the name maps to, as numeric text. nullopt on failure.
    virtual std::optional<std::vector<std::string>> resolve(const std::string& host) const = 0;
};

class SystemResolver : public HostResolver {
public:
    std::optional<std::vector<std::string>> resolve(const std::string& host) const override;
};

enum class DenyReason {
    None,
    NotAllowlisted,
    Unresolvable,
    PrivateAddress,
};


struct HostDecision {
    bool allowed = false;
    DenyReason reason = DenyReason::None;
    std::string message;
    // Addresses the decision was made on; the fetch is pinned to these
    std::vector<std::string> addresses;
};

// Loopback, link-local, RFC 1918 and IPv6 ULA. Text that is not an IP
// literal counts as private.
bool is_private_address(std::string_view ip);

class SsrfGuard {
public:
    SsrfGuard(std::vector<std::string> allowed_hosts, bool block_private_addresses,
              std::shared_ptr<const HostResolver> resolver);

    // Decides once per request, resolving afresh every time.
    HostDecision authorize(const std::string& hostname) const;

    bool is_allowlisted(const std::string& hostname) const;

private:
    std::vector<std::string> allowed_hosts_;
    bool block_private_addresses_;
    std::shared_ptr<const HostResolver> resolver_;
};

} // namespace sleek::proxy
