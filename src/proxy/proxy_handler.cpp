#include <sleek/proxy/proxy_handler.h>

#include <sleek/html/serializer.h>
#include <sleek/html/tree_builder.h>
#include <sleek/net/content_encoding.h>
#include <sleek/proxy/header_sanitizer.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>

namespace sleek::proxy {
namespace {

constexpr const char kModule[] = "proxy";

std::string to_lower_ascii(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void set_text_body(ProxyResponse& response, int status, const std::string& message) {
    response.status = status;
    response.headers = net::HeaderMap();
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.body = message;
    response.stream.reset();
    response.content_length.reset();
}

} // namespace

const char* proxy_error_name(ProxyError error) {
    switch (error) {
        case ProxyError::None:          return "none";
        case ProxyError::Validation:    return "validation";
        case ProxyError::Authorization: return "authorization";
        case ProxyError::Upstream:      return "upstream";
        case ProxyError::Internal:      return "internal";
    }
    return "unknown";
}

bool is_html_content_type(std::string_view content_type) {
    return to_lower_ascii(content_type).find("text/html") != std::string::npos;
}

ProxyHandler::ProxyHandler(core::ProxyConfig config, std::shared_ptr<const net::Fetcher> fetcher,
                           std::shared_ptr<const HostResolver> resolver)
    : config_(std::move(config)),
      fetcher_(std::move(fetcher)),
      guard_(config_.allowed_hosts, config_.block_private_addresses, std::move(resolver)) {}

void ProxyHandler::fail(ProxyResponse& response, TransactionStage stage, ProxyError error,
                        const std::string& message, core::DiagnosticEmitter& diag) const {
    response.transaction.advance(stage, message);
    response.error = error;
    set_text_body(response, failure_status(stage), message);
    diag.error(kModule, transaction_stage_name(stage), message);
}

ProxyResponse ProxyHandler::handle(const ProxyRequest& request,
                                   core::DiagnosticEmitter& diag) const {
    ProxyResponse response;
    diag.info(kModule, transaction_stage_name(TransactionStage::Received),
              request.target.empty() ? "(no target)" : request.target);
    try {
        run(request, response, diag);
    } catch (const std::exception& e) {
        fail(response, TransactionStage::InternalError, ProxyError::Internal,
             std::string("Proxy error: ") + e.what(), diag);
    }
    return response;
}

void ProxyHandler::run(const ProxyRequest& request, ProxyResponse& response,
                       core::DiagnosticEmitter& diag) const {
    // ---- Validate ----
    if (request.target.empty()) {
        fail(response, TransactionStage::RejectedValidation, ProxyError::Validation,
             "Missing url parameter. Usage: " + config_.mount_path + "?url=https://example.com",
             diag);
        return;
    }
    TargetParse parsed = parse_target(request.target);
    if (!parsed.target) {
        fail(response, TransactionStage::RejectedValidation, ProxyError::Validation,
             parsed.message, diag);
        return;
    }
    const ResolvedTarget& target = *parsed.target;
    response.transaction.advance(TransactionStage::Validated, target.href);
    diag.info(kModule, "validated", target.href);

    // ---- Authorize ----
    HostDecision decision = guard_.authorize(target.hostname);
    if (!decision.allowed) {
        fail(response, TransactionStage::RejectedGuard, ProxyError::Authorization,
             decision.message, diag);
        return;
    }
    response.transaction.advance(TransactionStage::Authorized, target.hostname);
    diag.info(kModule, "authorized",
              decision.addresses.empty()
                  ? target.hostname
                  : target.hostname + " -> " + std::to_string(decision.addresses.size()) +
                        " address(es)");

    // ---- Fetch ----
    net::Request upstream_request;
    upstream_request.url = target.href;
    upstream_request.method = net::Method::GET;
    if (!upstream_request.parse_url()) {
        fail(response, TransactionStage::RejectedValidation, ProxyError::Validation,
             "Invalid URL: " + target.href, diag);
        return;
    }
    upstream_request.headers.set("User-Agent",
                                 request.user_agent && !request.user_agent->empty()
                                     ? *request.user_agent
                                     : config_.default_user_agent);
    upstream_request.addresses = decision.addresses;
    upstream_request.is_cancelled = request.is_cancelled;

    net::FetchOutcome outcome = fetcher_->fetch(upstream_request);
    if (!outcome.ok) {
        fail(response, TransactionStage::UpstreamFailed, ProxyError::Upstream,
             "Upstream request failed: " + outcome.message + " (" +
                 net::fetch_error_name(outcome.error) + ")",
             diag);
        return;
    }
    net::UpstreamReply& reply = outcome.reply;
    response.transaction.advance(TransactionStage::Fetched,
                                 std::to_string(reply.head.status));
    diag.info(kModule, "fetched", "upstream status " + std::to_string(reply.head.status));

    // ---- Classify ----
    std::string content_type = reply.head.content_type();
    bool html = is_html_content_type(content_type);
    response.transaction.advance(TransactionStage::Classified, html ? "html" : "opaque");
    diag.info(kModule, "classified",
              (html ? "html: " : "opaque: ") +
                  (content_type.empty() ? std::string("(no content type)") : content_type));

    if (html) {
        rewrite_html(target, reply, response, diag);
    } else {
        pass_through(target, reply, response, diag);
    }
}

void ProxyHandler::rewrite_html(const ResolvedTarget& target, net::UpstreamReply& reply,
                                ProxyResponse& response, core::DiagnosticEmitter& diag) const {
    net::DrainResult drained = net::drain(*reply.body, config_.max_document_bytes);
    if (!drained.ok) {
        fail(response, TransactionStage::UpstreamFailed, ProxyError::Upstream,
             "Upstream body error: " + drained.error, diag);
        return;
    }

    auto coding = net::parse_content_coding(
        reply.head.headers.get("content-encoding").value_or(""));
    net::DecodeResult decoded =
        net::decode_body(drained.data, coding, config_.max_document_bytes);
    if (decoded.too_large) {
        fail(response, TransactionStage::UpstreamFailed, ProxyError::Upstream,
             "Upstream body error: document exceeds " +
                 std::to_string(config_.max_document_bytes) + " bytes",
             diag);
        return;
    }
    if (!decoded.ok) {
        fail(response, TransactionStage::UpstreamFailed, ProxyError::Upstream,
             "Upstream body error: cannot decode content encoding '" +
                 reply.head.headers.get("content-encoding").value_or("") + "'",
             diag);
        return;
    }
    // The compressed copy is no longer needed once the document is decoded
    drained.data.clear();
    drained.data.shrink_to_fit();

    std::string markup(decoded.data.begin(), decoded.data.end());
    auto document = html::parse(markup);

    RewriteContext context;
    context.base = target.url;
    context.mount_path = config_.mount_path;
    response.rewrite_stats = rewrite_document(*document, context);
    const RewriteStats& stats = response.rewrite_stats;

    for (const auto& policy : stats.removed_policies) {
        diag.warning(kModule, "rewritten",
                     "removed Content-Security-Policy meta tag: " +
                         (policy.empty() ? std::string("(empty)") : policy));
    }
    if (stats.document_base) {
        diag.info(kModule, "rewritten", "document base " + *stats.document_base);
    }
    if (stats.failed > 0) {
        diag.warning(kModule, "rewritten",
                     std::to_string(stats.failed) + " attribute value(s) left unresolved");
    }

    response.status = reply.head.status;
    response.headers = sanitize_response_headers(reply.head.headers);
    response.headers.remove("content-encoding");
    response.headers.set("Content-Type", "text/html; charset=utf-8");
    if (auto location = reply.head.headers.get("location")) {
        response.headers.set("Location",
                             resolve_and_proxy(target.url, *location, config_.mount_path));
    }
    response.body = html::serialize(*document);
    response.rewritten = true;

    response.transaction.advance(
        TransactionStage::Rewritten,
        std::to_string(stats.links + stats.resources + stats.stylesheets + stats.srcsets) +
            " rewritten, " + std::to_string(stats.skipped) + " kept");
    diag.info(kModule, "rewritten",
              "links=" + std::to_string(stats.links) +
                  " resources=" + std::to_string(stats.resources) +
                  " stylesheets=" + std::to_string(stats.stylesheets) +
                  " srcsets=" + std::to_string(stats.srcsets));
}

void ProxyHandler::pass_through(const ResolvedTarget& target, net::UpstreamReply& reply,
                                ProxyResponse& response, core::DiagnosticEmitter& diag) const {
    const net::HeaderMap& upstream = reply.head.headers;

    response.status = reply.head.status;
    response.headers = sanitize_response_headers(upstream);
    std::string content_type = reply.head.content_type();
    response.headers.set("Content-Type",
                         content_type.empty() ? "application/octet-stream" : content_type);
    if (auto location = upstream.get("location")) {
        response.headers.set("Location",
                             resolve_and_proxy(target.url, *location, config_.mount_path));
    }

    // A declared length is only meaningful for an unchunked body
    if (!upstream.has("transfer-encoding")) {
        if (auto length = upstream.get("content-length")) {
            uint64_t n = 0;
            auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(), n);
            if (ec == std::errc{} && ptr == length->data() + length->size()) {
                response.content_length = n;
            }
        }
    }
    response.stream = std::move(reply.body);

    response.transaction.advance(TransactionStage::PassedThrough, content_type);
    diag.info(kModule, "passed-through",
              response.content_length ? std::to_string(*response.content_length) + " bytes"
                                      : std::string("length unknown"));
}

} // namespace sleek::proxy
