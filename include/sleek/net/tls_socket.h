#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

typedef struct ssl_st SSL;

namespace sleek::net {

// Blocks until the socket is ready for the poll(2) events given, returning
// false when the caller's deadline passed or the fetch was cancelled.
using WaitFn = std::function<bool(short events)>;

class TlsSocket {
public:
    TlsSocket();
    ~TlsSocket();

    // Non-copyable, non-movable
    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;
    TlsSocket(TlsSocket&&) = delete;
    TlsSocket& operator=(TlsSocket&&) = delete;

    // Perform the client handshake over an already-connected non-blocking
    // fd. The TlsSocket does NOT own the fd; caller is responsible for
    // closing it. With verify_peer the chain is checked against the system
    // trust store and the certificate must match `host`.
    bool connect(const std::string& host, int fd, bool verify_peer, const WaitFn& wait);

    // Send data through TLS
    bool send(const uint8_t* data, size_t len, const WaitFn& wait);

    // Receive data through TLS.
    // Returns std::nullopt on error, empty vector on EOF/connection close.
    std::optional<std::vector<uint8_t>> recv(const WaitFn& wait);

    // Close the TLS session (does NOT close the underlying fd)
    void close();

    // Check whether the TLS session is active

    // Reason for the last failure, from the OpenSSL error queue
    const std::string& error() const { return error_; }

private:
    SSL* ssl_ = nullptr;
    int fd_ = -1;
    bool connected_ = false;
    std::string error_;

    // Waits for whatever SSL_get_error asked for; false on hard errors
    bool wait_for_retry(int rv, const WaitFn& wait, const char* operation);
};

} // namespace sleek::net
