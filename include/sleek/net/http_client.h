#pragma once
#include <sleek/net/fetcher.h>
#include <sleek/net/request.h>
#include <sleek/net/response.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace sleek::net {

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------
// HTTP/1.1 over TCP or TLS, one connection per request. A single deadline
// covers connect, handshake, send, header read and every later body read.
// Redirects are returned to the caller, never followed.
class HttpClient : public Fetcher {
public:
    static constexpr size_t kMaxHeadBytes = 64 * 1024;

    HttpClient();
    ~HttpClient() override;

    FetchOutcome fetch(const Request& request) const override;

    // Set the overall deadline for one fetch
    void set_timeout(std::chrono::milliseconds timeout);

    // Skip certificate verification (--insecure)
    void set_verify_tls(bool verify);

private:
    std::chrono::milliseconds timeout_{std::chrono::seconds(20)};
    bool verify_tls_ = true;
};

} // namespace sleek::net
