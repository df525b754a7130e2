#pragma once

#include <sleek/core/config.h>
#include <sleek/net/header_map.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sleek::server {

// Decodes "Basic <base64(user:pass)>". nullopt for other schemes or bad input.
std::optional<core::BasicCredentials> parse_basic_authorization(const std::string& header);

bool check_basic_auth(const net::HeaderMap& headers, const core::BasicCredentials& expected);

// Fixed one-minute windows per client key. The only shared mutable state in
// the request path, so every call takes the lock.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(uint32_t per_minute);

    bool allow(const std::string& client, Clock::time_point now = Clock::now());

    // Seconds until the client's current window ends
    int retry_after(const std::string& client, Clock::time_point now = Clock::now()) const;

private:
    struct Window {
        Clock::time_point started;
        uint32_t count = 0;
    };

    uint32_t per_minute_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
    Clock::time_point last_sweep_{};

    void sweep(Clock::time_point now);
};

struct AccessDecision {
    bool allowed = true;
    int status = 200;
    net::HeaderMap headers;
    std::string body;
};

// Runs ahead of every route: basic auth first, then the rate limit.
class AccessControl {
public:
    explicit AccessControl(const core::ProxyConfig& config);

    AccessDecision check(const net::HeaderMap& headers, const std::string& client_address);

private:
    std::optional<core::BasicCredentials> credentials_;
    std::optional<RateLimiter> limiter_;
};

} // namespace sleek::server
