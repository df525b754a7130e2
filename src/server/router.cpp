#include <sleek/server/router.h>

namespace sleek::server {

proxy::ProxyResponse text_response(int status, const std::string& body) {
    proxy::ProxyResponse response;
    response.status = status;
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.body = body;
    return response;
}

Router::Router(const core::ProxyConfig& config, std::shared_ptr<const proxy::ProxyHandler> handler)
    : mount_path_(config.mount_path),
      handler_(std::move(handler)),
      static_files_(config.public_dir),
      access_(config) {}

proxy::ProxyResponse Router::route(const HttpRequest& request, core::DiagnosticEmitter& diag,
                                   std::function<bool()> is_cancelled) {
    AccessDecision access = access_.check(request.headers, request.client_address);
    if (!access.allowed) {
        diag.warning("server", "access", std::to_string(access.status) + " for " +
                                             request.client_address + " " + request.path);
        proxy::ProxyResponse response;
        response.status = access.status;
        response.headers = std::move(access.headers);
        response.body = std::move(access.body);
        return response;
    }

    if (request.path == mount_path_) {
        if (request.method != "GET") {
            auto response = text_response(405, "Method not allowed");
            response.headers.set("Allow", "GET");
            return response;
        }
        proxy::ProxyRequest proxy_request;
        proxy_request.target = request.query_parameter("url").value_or("");
        proxy_request.user_agent = request.headers.get("user-agent");
        proxy_request.is_cancelled = std::move(is_cancelled);
        return handler_->handle(proxy_request, diag);
    }

    return serve_static(request, diag);
}

proxy::ProxyResponse Router::serve_static(const HttpRequest& request,
                                          core::DiagnosticEmitter& diag) const {
    if (request.method != "GET" && request.method != "HEAD") {
        auto response = text_response(405, "Method not allowed");
        response.headers.set("Allow", "GET, HEAD");
        return response;
    }

    auto file = static_files_.resolve(request.path);
    if (!file) {
        return text_response(404, "Not found");
    }
    auto contents = StaticFiles::load(*file);
    if (!contents) {
        diag.error("server", "static", "cannot read " + file->path.string());
        return text_response(500, "Internal server error");
    }

    proxy::ProxyResponse response;
    response.status = 200;
    response.headers.set("Content-Type", file->content_type);
    response.headers.set("Cache-Control", "no-cache");
    response.body = std::move(*contents);
    return response;
}

} // namespace sleek::server
