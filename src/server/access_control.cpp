#include <sleek/server/access_control.h>

#include <sleek/core/base64.h>

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace sleek::server {
namespace {

constexpr std::chrono::seconds kWindow{60};

// Timing does not depend on where equal-length secrets differ
bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

std::optional<core::BasicCredentials> parse_basic_authorization(const std::string& header) {
    size_t start = header.find_first_not_of(" \t");
    if (start == std::string::npos) return std::nullopt;
    size_t sp = header.find(' ', start);
    if (sp == std::string::npos) return std::nullopt;

    std::string scheme = header.substr(start, sp - start);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "basic") return std::nullopt;

    std::string token = header.substr(sp + 1);
    token.erase(0, token.find_first_not_of(" \t"));
    token.erase(token.find_last_not_of(" \t") + 1);
    if (token.empty()) return std::nullopt;

    auto decoded = core::base64_decode(token);
    if (!decoded) return std::nullopt;

    std::string pair(decoded->begin(), decoded->end());
    size_t colon = pair.find(':');
    if (colon == std::string::npos) return std::nullopt;
    return core::BasicCredentials{pair.substr(0, colon), pair.substr(colon + 1)};
}

bool check_basic_auth(const net::HeaderMap& headers, const core::BasicCredentials& expected) {
    auto header = headers.get("authorization");
    if (!header) return false;
    auto supplied = parse_basic_authorization(*header);
    if (!supplied) return false;
    // Evaluate both so timing does not reveal which half matched
    bool user_ok = constant_time_equals(supplied->user, expected.user);
    bool password_ok = constant_time_equals(supplied->password, expected.password);
    return user_ok && password_ok;
}

// ---------------------------------------------------------------------------
// RateLimiter
// ---------------------------------------------------------------------------

RateLimiter::RateLimiter(uint32_t per_minute) : per_minute_(per_minute) {}

void RateLimiter::sweep(Clock::time_point now) {
    if (now - last_sweep_ < kWindow) return;
    last_sweep_ = now;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.started >= kWindow) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

bool RateLimiter::allow(const std::string& client, Clock::time_point now) {
    if (per_minute_ == 0) return true;

    std::lock_guard lock(mutex_);
    sweep(now);

    auto [it, inserted] = windows_.try_emplace(client, Window{now, 0});
    Window& window = it->second;
    if (!inserted && now - window.started >= kWindow) {
        window = Window{now, 0};
    }
    if (window.count >= per_minute_) {
        return false;
    }
    ++window.count;
    return true;
}

int RateLimiter::retry_after(const std::string& client, Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    auto it = windows_.find(client);
    if (it == windows_.end()) return 0;
    auto left = std::chrono::duration_cast<std::chrono::seconds>(
        it->second.started + kWindow - now);
    return std::max(1, static_cast<int>(left.count()));
}

// ---------------------------------------------------------------------------
// AccessControl
// ---------------------------------------------------------------------------

AccessControl::AccessControl(const core::ProxyConfig& config)
    : credentials_(config.basic_auth) {
    if (config.rate_limit_per_minute > 0) {
        limiter_.emplace(config.rate_limit_per_minute);
    }
}

AccessDecision AccessControl::check(const net::HeaderMap& headers,
                                    const std::string& client_address) {
    AccessDecision decision;

    if (credentials_ && !check_basic_auth(headers, *credentials_)) {
        decision.allowed = false;
        decision.status = 401;
        decision.headers.set("WWW-Authenticate", "Basic realm=\"SleekProxy\", charset=\"UTF-8\"");
        decision.headers.set("Content-Type", "text/plain; charset=utf-8");
        decision.body = "Authentication required";
        return decision;
    }

    if (limiter_ && !limiter_->allow(client_address)) {
        decision.allowed = false;
        decision.status = 429;
        decision.headers.set("Retry-After", std::to_string(limiter_->retry_after(client_address)));
        decision.headers.set("Content-Type", "text/plain; charset=utf-8");
        decision.body = "Too many requests";
        return decision;
    }

    return decision;
}

} // namespace sleek::server
