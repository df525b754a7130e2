#include <sleek/net/tls_socket.h>

#include <arpa/inet.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <poll.h>

#include <algorithm>
#include <climits>
#include <memory>

namespace sleek::net {

namespace {

struct CtxDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

// One context per verification mode, shared by every connection
SSL_CTX* client_context(bool verify_peer) {
    auto make = [](bool verify) {
        std::unique_ptr<SSL_CTX, CtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
        if (!ctx) return ctx;
        SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
        // Treat a missing close_notify as EOF; framing is checked by the caller
        SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
        if (verify) {
            SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
            if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
                ctx.reset();
            }
        } else {
            SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
        }
        return ctx;
    };
    static const std::unique_ptr<SSL_CTX, CtxDeleter> verifying = make(true);
    static const std::unique_ptr<SSL_CTX, CtxDeleter> permissive = make(false);
    return verify_peer ? verifying.get() : permissive.get();
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

std::string drain_error_queue(const char* operation) {
    std::string message = operation;
    unsigned long code = ERR_get_error();
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += ": ";
        message += buf;
    }
    ERR_clear_error();
    return message;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TlsSocket::TlsSocket() = default;

TlsSocket::~TlsSocket() {
    close();
}

bool TlsSocket::wait_for_retry(int rv, const WaitFn& wait, const char* operation) {
    int err = SSL_get_error(ssl_, rv);
    if (err == SSL_ERROR_WANT_READ) {
        if (!wait(POLLIN)) {
            error_ = std::string(operation) + ": timed out";
            return false;
        }
        return true;
    }
    if (err == SSL_ERROR_WANT_WRITE) {
        if (!wait(POLLOUT)) {
            error_ = std::string(operation) + ": timed out";
            return false;
        }
        return true;
    }
    if (err == SSL_ERROR_SSL && SSL_get_verify_result(ssl_) != X509_V_OK) {
        error_ = std::string(operation) + ": certificate verification failed: " +
                 X509_verify_cert_error_string(SSL_get_verify_result(ssl_));
        ERR_clear_error();
        return false;
    }
    error_ = drain_error_queue(operation);
    return false;
}

// ---------------------------------------------------------------------------
// connect - perform TLS handshake over an already-connected socket
// ---------------------------------------------------------------------------

bool TlsSocket::connect(const std::string& host, int fd, bool verify_peer, const WaitFn& wait) {
    // Clean up any previous session
    close();
    error_.clear();

    SSL_CTX* ctx = client_context(verify_peer);
    if (ctx == nullptr) {
        error_ = "tls: could not create client context";
        return false;
    }

    ssl_ = SSL_new(ctx);
    if (ssl_ == nullptr) {
        error_ = drain_error_queue("tls: SSL_new");
        return false;
    }
    fd_ = fd;
    SSL_set_fd(ssl_, fd);

    bool ip_literal = is_ip_literal(host);
    // SNI is only defined for DNS names
    if (!ip_literal) {
        SSL_set_tlsext_host_name(ssl_, host.c_str());
    }
    if (verify_peer) {
        bool pinned = ip_literal
            ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), host.c_str()) == 1
            : SSL_set1_host(ssl_, host.c_str()) == 1;
        if (!pinned) {
            error_ = drain_error_queue("tls: could not set expected host");
            close();
            return false;
        }
    }

    while (true) {
        int rv = SSL_connect(ssl_);
        if (rv == 1) break;
        if (!wait_for_retry(rv, wait, "tls handshake")) {
            close();
            return false;
        }
    }

    connected_ = true;
    return true;
}

// ---------------------------------------------------------------------------
// send - write data through the TLS session
// ---------------------------------------------------------------------------

bool TlsSocket::send(const uint8_t* data, size_t len, const WaitFn& wait) {
    if (!connected_ || ssl_ == nullptr) {
        return false;
    }

    size_t total_sent = 0;
    while (total_sent < len) {
        size_t chunk = std::min<size_t>(len - total_sent, INT_MAX);
        int rv = SSL_write(ssl_, data + total_sent, static_cast<int>(chunk));
        if (rv > 0) {
            total_sent += static_cast<size_t>(rv);
            continue;
        }
        if (!wait_for_retry(rv, wait, "tls write")) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// recv - read data from the TLS session
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>> TlsSocket::recv(const WaitFn& wait) {
    if (!connected_ || ssl_ == nullptr) {
        return std::nullopt;
    }

    constexpr size_t kChunkSize = 16384;
    uint8_t buf[kChunkSize];

    while (true) {
        int rv = SSL_read(ssl_, buf, static_cast<int>(kChunkSize));
        if (rv > 0) {
            return std::vector<uint8_t>(buf, buf + rv);
        }
        int err = SSL_get_error(ssl_, rv);
        if (err == SSL_ERROR_ZERO_RETURN) {
            // close_notify received - return empty vector to signal EOF
            return std::vector<uint8_t>{};
        }
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            // Peer closed TCP without close_notify; many servers do this
            ERR_clear_error();
            return std::vector<uint8_t>{};
        }
        if (!wait_for_retry(rv, wait, "tls read")) {
            return std::nullopt;
        }
    }
}

// ---------------------------------------------------------------------------
// close - tear down the TLS session
// ---------------------------------------------------------------------------

void TlsSocket::close() {
    if (ssl_ != nullptr) {
        if (connected_) {
            // Best effort; the fd is non-blocking so this never stalls
            SSL_shutdown(ssl_);
            ERR_clear_error();
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    connected_ = false;
    fd_ = -1;
}

} // namespace sleek::net
