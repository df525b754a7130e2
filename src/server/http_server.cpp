#include <sleek/server/http_server.h>

#include <sleek/server/http_request.h>
#include <sleek/server/response_writer.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace sleek::server {
namespace {

using Clock = std::chrono::steady_clock;

constexpr int kAcceptPollMs = 250;
constexpr size_t kQueuePerWorker = 64;

class SocketSink : public ByteSink {
public:
    explicit SocketSink(int fd) : fd_(fd) {}

    bool write(std::string_view bytes) override {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

private:
    int fd_;
};

// Closes the descriptor when the connection task ends
struct FdGuard {
    int fd;
    ~FdGuard() {
        if (fd >= 0) ::close(fd);
    }
};

std::string peer_address(const struct sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const struct sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

// True once the peer has hung up on its side of the connection
bool peer_gone(int fd) {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLRDHUP;
    int rv = ::poll(&pfd, 1, 0);
    return rv > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0;
}

void send_plain(int fd, int status, const std::string& body) {
    proxy::ProxyResponse response;
    response.status = status;
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.body = body;
    SocketSink sink(fd);
    write_response(sink, response, false, false);
}

} // namespace

HttpServer::HttpServer(core::ProxyConfig config, std::shared_ptr<Router> router,
                       core::DiagnosticObserver observer)
    : config_(std::move(config)), router_(std::move(router)), observer_(std::move(observer)) {}

HttpServer::~HttpServer() {
    if (pool_) pool_->shutdown();
    if (listen_fd_ >= 0) ::close(listen_fd_);
}

bool HttpServer::listen(std::string& error) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST;

    std::string port_str = std::to_string(config_.port);
    struct addrinfo* result = nullptr;
    int rv = ::getaddrinfo(config_.listen_host.empty() ? nullptr : config_.listen_host.c_str(),
                           port_str.c_str(), &hints, &result);
    if (rv != 0 || result == nullptr) {
        error = "invalid listen address " + config_.listen_host + ": " + ::gai_strerror(rv);
        return false;
    }

    for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (fd < 0) {
            error = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, rp->ai_addr, rp->ai_addrlen) != 0 || ::listen(fd, SOMAXCONN) != 0) {
            error = "cannot listen on " + config_.listen_host + ":" + port_str + ": " +
                    std::strerror(errno);
            ::close(fd);
            continue;
        }
        listen_fd_ = fd;
        break;
    }
    ::freeaddrinfo(result);
    if (listen_fd_ < 0) return false;

    struct sockaddr_storage bound {};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.ss_family == AF_INET6
                                ? reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port
                                : reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
    }

    pool_ = std::make_unique<platform::ThreadPool>(config_.worker_threads);
    error.clear();
    return true;
}

void HttpServer::serve(const std::function<bool()>& should_stop) {
    while (!should_stop()) {
        struct pollfd pfd {};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rv = ::poll(&pfd, 1, kAcceptPollMs);
        if (rv <= 0) continue;

        struct sockaddr_storage addr {};
        socklen_t len = sizeof(addr);
        int fd = ::accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                           SOCK_CLOEXEC);
        if (fd < 0) continue;

        std::string peer = peer_address(addr);
        uint64_t id = next_id_.fetch_add(1);
        bool queued = pool_->try_post(
            [this, fd, peer, id]() {
                try {
                    handle_connection(fd, peer, id);
                } catch (const std::exception& e) {
                    core::DiagnosticEmitter diag;
                    diag.set_correlation_id(id);
                    if (observer_) diag.add_observer(observer_);
                    diag.error("server", "connection", std::string("unhandled: ") + e.what());
                }
            },
            pool_->size() * kQueuePerWorker);
        if (!queued) {
            send_plain(fd, 503, "Server busy");
            ::close(fd);
        }
    }
    pool_->shutdown();
}

void HttpServer::handle_connection(int fd, const std::string& peer, uint64_t id) {
    FdGuard guard{fd};

    core::DiagnosticEmitter diag;
    diag.set_correlation_id(id);
    diag.set_min_severity(config_.log_level);
    if (observer_) diag.add_observer(observer_);

    struct timeval send_timeout {};
    send_timeout.tv_sec = kSendTimeout.count();
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout));

    // ---- Read the request head ----
    std::string buffer;
    HttpRequest request;
    size_t consumed = 0;
    auto deadline = Clock::now() + kRequestReadTimeout;
    while (true) {
        ParseStatus status = parse_request_head(buffer, request, consumed);
        if (status == ParseStatus::Complete) break;
        if (status == ParseStatus::Invalid) {
            send_plain(fd, 400, "Bad request");
            return;
        }
        if (status == ParseStatus::TooLarge) {
            send_plain(fd, 431, "Request header fields too large");
            return;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) return;
        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rv = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rv < 0 && errno == EINTR) continue;
        if (rv <= 0) return;

        char chunk[4096];
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        buffer.append(chunk, static_cast<size_t>(n));
    }
    request.client_address = peer;

    // ---- Route ----
    auto started = Clock::now();
    proxy::ProxyResponse response =
        router_->route(request, diag, [fd]() { return peer_gone(fd); });

    // ---- Write ----
    SocketSink sink(fd);
    WriteSummary summary = write_response(sink, response, request.method == "HEAD",
                                          request.version == "HTTP/1.1");
    double elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    std::string line = request.method + " " + request.path + " -> " +
                       std::to_string(response.status) + " (" +
                       std::to_string(summary.body_bytes) + " bytes, " +
                       std::to_string(static_cast<long long>(elapsed_ms)) + " ms)";
    if (response.error != proxy::ProxyError::None) {
        line += std::string(" [") + proxy::proxy_error_name(response.error) + "]";
    }
    switch (summary.result) {
        case WriteResult::Complete:
            if (response.transaction.current() == proxy::TransactionStage::Rewritten ||
                response.transaction.current() == proxy::TransactionStage::PassedThrough) {
                response.transaction.advance(proxy::TransactionStage::Responded, line);
            }
            diag.info("server", "responded", line);
            break;
        case WriteResult::ClientGone:
            diag.warning("server", "responded", line + ": " + summary.error);
            break;
        case WriteResult::UpstreamFailed:
            diag.error("server", "responded", line + ": upstream body failed: " + summary.error);
            break;
    }
}

} // namespace sleek::server
