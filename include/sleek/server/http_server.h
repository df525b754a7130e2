#pragma once

#include <sleek/core/config.h>
#include <sleek/core/diagnostics.h>
#include <sleek/platform/thread_pool.h>
#include <sleek/server/router.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sleek::server {

// Accepts on the calling thread and hands every connection to the worker
// pool. One request per connection.
class HttpServer {
public:
    static constexpr std::chrono::seconds kRequestReadTimeout{15};
    static constexpr std::chrono::seconds kSendTimeout{30};

    HttpServer(core::ProxyConfig config, std::shared_ptr<Router> router,
               core::DiagnosticObserver observer);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and listens; false with `error` set on failure
    bool listen(std::string& error);

    // Blocks until should_stop() returns true, then drains the pool
    void serve(const std::function<bool()>& should_stop);

    // Port actually bound (useful with port 0)
    uint16_t bound_port() const { return bound_port_; }

private:
    core::ProxyConfig config_;
    std::shared_ptr<Router> router_;
    core::DiagnosticObserver observer_;
    std::unique_ptr<platform::ThreadPool> pool_;
    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<uint64_t> next_id_{1};

    void handle_connection(int fd, const std::string& peer, uint64_t id);
};

} // namespace sleek::server
