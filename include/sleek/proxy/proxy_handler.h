#pragma once

#include <sleek/core/config.h>
#include <sleek/core/diagnostics.h>
#include <sleek/net/body_stream.h>
#include <sleek/net/fetcher.h>
#include <sleek/net/header_map.h>
#include <sleek/proxy/link_rewriter.h>
#include <sleek/proxy/ssrf_guard.h>
#include <sleek/proxy/transaction.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sleek::proxy {

enum class ProxyError {
    None,
    Validation,     // 400
    Authorization,  // 403
    Upstream,       // 502
    Internal,       // 500
};

const char* proxy_error_name(ProxyError error);

struct ProxyRequest {
    // Decoded value of the url= query parameter
    std::string target;
    std::optional<std::string> user_agent;
    // Reports whether the caller has gone away
    std::function<bool()> is_cancelled;
};

struct ProxyResponse {
    int status = 200;
    net::HeaderMap headers;
    // Rewritten document or error text; unused when stream is set
    std::string body;
    // Passthrough bytes, relayed as they arrive
    std::unique_ptr<net::BodyStream> stream;
    std::optional<uint64_t> content_length;
    bool rewritten = false;
    ProxyError error = ProxyError::None;
    ProxyTransaction transaction;
    RewriteStats rewrite_stats;
};

// The orchestrator: validate, authorize, fetch, classify, rewrite or pass
// through, sanitize. Stateless between calls and safe to share across
// worker threads.
class ProxyHandler {
public:
    ProxyHandler(core::ProxyConfig config, std::shared_ptr<const net::Fetcher> fetcher,
                 std::shared_ptr<const HostResolver> resolver = nullptr);

    ProxyResponse handle(const ProxyRequest& request, core::DiagnosticEmitter& diag) const;

    const core::ProxyConfig& config() const { return config_; }

private:
    core::ProxyConfig config_;
    std::shared_ptr<const net::Fetcher> fetcher_;
    SsrfGuard guard_;

    void run(const ProxyRequest& request, ProxyResponse& response,
             core::DiagnosticEmitter& diag) const;
    void rewrite_html(const ResolvedTarget& target, net::UpstreamReply& reply,
                      ProxyResponse& response, core::DiagnosticEmitter& diag) const;
    void pass_through(const ResolvedTarget& target, net::UpstreamReply& reply,
                      ProxyResponse& response, core::DiagnosticEmitter& diag) const;
    void fail(ProxyResponse& response, TransactionStage stage, ProxyError error,
              const std::string& message, core::DiagnosticEmitter& diag) const;
};

// True when a Content-Type value names an HTML document
bool is_html_content_type(std::string_view content_type);

} // namespace sleek::proxy
