#include <sleek/net/http_client.h>
#include <sleek/net/tls_socket.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <functional>
#include <string_view>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sleek::net {

namespace {

using Clock = std::chrono::steady_clock;

// Cancellation is checked at least this often while blocked on the network
constexpr std::chrono::milliseconds kPollSlice{250};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string strip_brackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

// ---------------------------------------------------------------------------
// Connection: one socket, optionally wrapped in TLS, bound to a deadline
// ---------------------------------------------------------------------------

class Connection {
public:
    enum class Interrupt { None, Timeout, Cancelled };

    Connection(Clock::time_point deadline, std::function<bool()> is_cancelled)
        : deadline_(deadline), is_cancelled_(std::move(is_cancelled)) {
        wait_ = [this](short events) { return wait(events); };
    }

    ~Connection() {
        tls_.close();
        if (fd_ >= 0) ::close(fd_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Interrupt interrupt() const { return interrupt_; }
    const std::string& error() const { return error_; }

    bool connect(const std::vector<std::string>& pinned, const std::string& host, uint16_t port);
    bool start_tls(const std::string& host, bool verify_peer);
    bool send_all(const std::vector<uint8_t>& data);

    // Next chunk of bytes, empty on EOF, nullopt on error/timeout/cancel
    std::optional<std::vector<uint8_t>> recv_some();

    // Poll in short slices so the cancellation check runs often
    bool wait(short events);

private:
    int fd_ = -1;
    bool use_tls_ = false;
    TlsSocket tls_;
    Clock::time_point deadline_;
    std::function<bool()> is_cancelled_;
    WaitFn wait_;
    Interrupt interrupt_ = Interrupt::None;
    std::string error_;

    bool try_address(const struct addrinfo* ai);
};

bool Connection::wait(short events) {
    while (true) {
        if (is_cancelled_ && is_cancelled_()) {
            interrupt_ = Interrupt::Cancelled;
            error_ = "fetch cancelled";
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - Clock::now());
        if (remaining.count() <= 0) {
            interrupt_ = Interrupt::Timeout;
            error_ = "upstream timed out";
            return false;
        }

        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = events;
        int poll_rv = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollSlice).count()));
        if (poll_rv < 0) {
            if (errno == EINTR) continue;
            error_ = std::string("poll: ") + std::strerror(errno);
            return false;
        }
        if (poll_rv > 0) {
            // POLLERR/POLLHUP surface through the following read or write
            return true;
        }
    }
}

bool Connection::try_address(const struct addrinfo* ai) {
    fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd_ < 0) {
        error_ = std::string("socket: ") + std::strerror(errno);
        return false;
    }

    // Non-blocking for the whole lifetime; every wait goes through poll
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        error_ = std::string("fcntl: ") + std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    int rv = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
    if (rv == 0) return true;

    if (errno == EINPROGRESS && wait(POLLOUT)) {
        // Check for socket error
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) == 0 &&
            sock_err == 0) {
            return true;
        }
        error_ = std::string("connect: ") + std::strerror(sock_err != 0 ? sock_err : errno);
    } else if (interrupt_ == Interrupt::None) {
        error_ = std::string("connect: ") + std::strerror(errno);
    }

    ::close(fd_);
    fd_ = -1;
    return false;
}

bool Connection::connect(const std::vector<std::string>& pinned, const std::string& host,
                         uint16_t port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port_str = std::to_string(port);

    // Pinned addresses are literals already vetted by the caller; resolving
    // them with AI_NUMERICHOST never touches DNS.
    std::vector<std::string> targets = pinned;
    if (targets.empty()) {
        targets.push_back(strip_brackets(host));
    } else {
        hints.ai_flags = AI_NUMERICHOST;
    }

    for (const auto& target : targets) {
        struct addrinfo* result = nullptr;
        int rv = ::getaddrinfo(target.c_str(), port_str.c_str(), &hints, &result);
        if (rv != 0 || result == nullptr) {
            error_ = "cannot resolve " + target + ": " + ::gai_strerror(rv);
            continue;
        }
        for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
            if (try_address(rp)) {
                ::freeaddrinfo(result);
                return true;
            }
            if (interrupt_ != Interrupt::None) {
                ::freeaddrinfo(result);
                return false;
            }
        }
        ::freeaddrinfo(result);
    }
    return false;
}

bool Connection::start_tls(const std::string& host, bool verify_peer) {
    if (!tls_.connect(strip_brackets(host), fd_, verify_peer, wait_)) {
        if (interrupt_ == Interrupt::None) error_ = tls_.error();
        return false;
    }
    use_tls_ = true;
    return true;
}

bool Connection::send_all(const std::vector<uint8_t>& data) {
    if (use_tls_) {
        if (!tls_.send(data.data(), data.size(), wait_)) {
            if (interrupt_ == Interrupt::None) error_ = tls_.error();
            return false;
        }
        return true;
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (!wait(POLLOUT)) return false;
                continue;
            }
            error_ = std::string("send: ") + std::strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::vector<uint8_t>> Connection::recv_some() {
    if (use_tls_) {
        auto chunk = tls_.recv(wait_);
        if (!chunk && interrupt_ == Interrupt::None) error_ = tls_.error();
        return chunk;
    }

    constexpr size_t kChunkSize = 16384;
    uint8_t buf[kChunkSize];
    while (true) {
        ssize_t n = ::recv(fd_, buf, kChunkSize, 0);
        if (n > 0) {
            return std::vector<uint8_t>(buf, buf + n);
        }
        if (n == 0) {
            // Connection closed by peer
            return std::vector<uint8_t>{};
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait(POLLIN)) return std::nullopt;
            continue;
        }
        error_ = std::string("recv: ") + std::strerror(errno);
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// SocketBodyStream: body framing over a live connection
// ---------------------------------------------------------------------------

enum class Framing { None, Length, Chunked, UntilClose };

class SocketBodyStream : public BodyStream {
public:
    SocketBodyStream(std::unique_ptr<Connection> conn, Framing framing,
                     uint64_t content_length, std::vector<uint8_t> leftover)
        : conn_(std::move(conn)), framing_(framing), remaining_(content_length),
          pending_(std::move(leftover)) {
        if (framing_ == Framing::None ||
            (framing_ == Framing::Length && remaining_ == 0)) {
            finish();
        }
    }

    std::optional<std::vector<uint8_t>> read() override {
        if (failed_) return std::nullopt;
        if (finished_) return std::vector<uint8_t>{};

        switch (framing_) {
            case Framing::Length:     return read_length();
            case Framing::Chunked:    return read_chunked();
            case Framing::UntilClose: return read_until_close();
            case Framing::None:       break;
        }
        finish();
        return std::vector<uint8_t>{};
    }

    std::string error() const override { return error_; }

private:
    std::unique_ptr<Connection> conn_;
    Framing framing_;
    uint64_t remaining_;
    std::vector<uint8_t> pending_;
    ChunkedDecoder decoder_;
    bool finished_ = false;
    bool failed_ = false;
    std::string error_;

    void finish() {
        finished_ = true;
        // Drop the socket as soon as the body is complete
        conn_.reset();
    }

    std::optional<std::vector<uint8_t>> fail(std::string message) {
        failed_ = true;
        error_ = std::move(message);
        conn_.reset();
        return std::nullopt;
    }

    // Buffered bytes from the head read first, then the socket
    std::optional<std::vector<uint8_t>> next_input() {
        if (!pending_.empty()) {
            std::vector<uint8_t> out;
            out.swap(pending_);
            return out;
        }
        auto chunk = conn_->recv_some();
        if (!chunk) {
            return fail(conn_->error().empty() ? "upstream read failed" : conn_->error());
        }
        return chunk;
    }

    std::optional<std::vector<uint8_t>> read_length() {
        auto chunk = next_input();
        if (!chunk) return std::nullopt;
        if (chunk->empty()) {
            return fail("upstream closed with " + std::to_string(remaining_) +
                        " body bytes outstanding");
        }
        if (chunk->size() > remaining_) {
            chunk->resize(static_cast<size_t>(remaining_));
        }
        remaining_ -= chunk->size();
        if (remaining_ == 0) finish();
        return chunk;
    }

    std::optional<std::vector<uint8_t>> read_chunked() {
        while (true) {
            auto chunk = next_input();
            if (!chunk) return std::nullopt;
            if (chunk->empty()) {
                return fail("upstream closed inside chunked body");
            }
            std::vector<uint8_t> out;
            if (!decoder_.feed(chunk->data(), chunk->size(), out)) {
                return fail("malformed chunked encoding");
            }
            if (decoder_.done()) finish();
            if (!out.empty()) return out;
            if (finished_) return std::vector<uint8_t>{};
        }
    }

    std::optional<std::vector<uint8_t>> read_until_close() {
        auto chunk = next_input();
        if (!chunk) return std::nullopt;
        if (chunk->empty()) finish();
        return chunk;
    }
};

// Offset just past the blank line ending the head, or npos
size_t find_head_end(const std::vector<uint8_t>& buf) {
    for (size_t i = 0; i < buf.size(); ++i) {
        if (buf[i] != '\n') continue;
        if (i + 1 < buf.size() && buf[i + 1] == '\n') return i + 2;
        if (i + 2 < buf.size() && buf[i + 1] == '\r' && buf[i + 2] == '\n') return i + 3;
    }
    return std::string::npos;
}

FetchError interrupt_error(const Connection& conn, FetchError otherwise) {
    switch (conn.interrupt()) {
        case Connection::Interrupt::Timeout:   return FetchError::Timeout;
        case Connection::Interrupt::Cancelled: return FetchError::Cancelled;
        case Connection::Interrupt::None:      break;
    }
    return otherwise;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------

HttpClient::HttpClient() = default;
HttpClient::~HttpClient() = default;

void HttpClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void HttpClient::set_verify_tls(bool verify) {
    verify_tls_ = verify;
}

FetchOutcome HttpClient::fetch(const Request& input) const {
    Request request = input;
    if (request.host.empty() && !request.parse_url()) {
        return FetchOutcome::failure(FetchError::InvalidRequest,
                                     "not an http(s) URL: " + request.url);
    }

    auto conn = std::make_unique<Connection>(Clock::now() + timeout_, request.is_cancelled);

    if (!conn->connect(request.addresses, request.host, request.port)) {
        return FetchOutcome::failure(interrupt_error(*conn, FetchError::ConnectFailed),
                                     conn->error());
    }
    if (request.use_tls && !conn->start_tls(request.host, verify_tls_)) {
        return FetchOutcome::failure(interrupt_error(*conn, FetchError::TlsFailed),
                                     conn->error());
    }
    if (!conn->send_all(request.serialize())) {
        return FetchOutcome::failure(interrupt_error(*conn, FetchError::ConnectFailed),
                                     conn->error());
    }

    // Read heads until a final (non-1xx) response arrives
    std::vector<uint8_t> buffer;
    std::optional<Response> head;
    while (!head) {
        size_t head_end = find_head_end(buffer);
        if (head_end == std::string::npos) {
            if (buffer.size() > kMaxHeadBytes) {
                return FetchOutcome::failure(FetchError::BadResponse,
                                             "upstream response head too large");
            }
            auto chunk = conn->recv_some();
            if (!chunk) {
                return FetchOutcome::failure(interrupt_error(*conn, FetchError::BadResponse),
                                             conn->error());
            }
            if (chunk->empty()) {
                return FetchOutcome::failure(FetchError::BadResponse,
                                             "upstream closed before sending a response");
            }
            buffer.insert(buffer.end(), chunk->begin(), chunk->end());
            continue;
        }

        std::string_view text(reinterpret_cast<const char*>(buffer.data()), head_end);
        auto parsed = Response::parse_head(text);
        if (!parsed) {
            return FetchOutcome::failure(FetchError::BadResponse,
                                         "malformed upstream response head");
        }
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(head_end));
        if (parsed->status >= 100 && parsed->status < 200) {
            continue;  // interim response, e.g. 100 Continue
        }
        head = std::move(parsed);
    }
    head->url = request.url;

    // Body framing
    Framing framing = Framing::UntilClose;
    uint64_t content_length = 0;
    if (!head->has_body(request.method)) {
        framing = Framing::None;
    } else if (auto te = head->headers.get("transfer-encoding")) {
        std::string codings = to_lower(*te);
        auto comma = codings.rfind(',');
        std::string last = comma == std::string::npos ? codings : codings.substr(comma + 1);
        last.erase(0, last.find_first_not_of(" \t"));
        last.erase(last.find_last_not_of(" \t") + 1);
        framing = last == "chunked" ? Framing::Chunked : Framing::UntilClose;
    } else if (head->headers.has("content-length")) {
        std::optional<uint64_t> agreed;
        for (const auto& value : head->headers.get_all("content-length")) {
            uint64_t n = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec != std::errc{} || ptr != value.data() + value.size() ||
                (agreed && *agreed != n)) {
                return FetchOutcome::failure(FetchError::BadResponse,
                                             "invalid Content-Length: " + value);
            }
            agreed = n;
        }
        framing = Framing::Length;
        content_length = *agreed;
    }

    auto body = std::make_unique<SocketBodyStream>(std::move(conn), framing, content_length,
                                                   std::move(buffer));
    return FetchOutcome::success(std::move(*head), std::move(body));
}

} // namespace sleek::net
