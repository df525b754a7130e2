#pragma once

#include <sleek/core/config.h>
#include <sleek/core/diagnostics.h>
#include <sleek/proxy/proxy_handler.h>
#include <sleek/server/access_control.h>
#include <sleek/server/http_request.h>
#include <sleek/server/static_files.h>

#include <functional>
#include <memory>
#include <string>

namespace sleek::server {

// Access control, then the proxy mount, then static files.
class Router {
public:
    Router(const core::ProxyConfig& config, std::shared_ptr<const proxy::ProxyHandler> handler);

    proxy::ProxyResponse route(const HttpRequest& request, core::DiagnosticEmitter& diag,
                               std::function<bool()> is_cancelled = {});

private:
    std::string mount_path_;
    std::shared_ptr<const proxy::ProxyHandler> handler_;
    StaticFiles static_files_;
    AccessControl access_;

    proxy::ProxyResponse serve_static(const HttpRequest& request,
                                      core::DiagnosticEmitter& diag) const;
};

// Plain-text response with no transaction beyond Received
proxy::ProxyResponse text_response(int status, const std::string& body);

} // namespace sleek::server
