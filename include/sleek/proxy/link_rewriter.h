#pragma once

#include <sleek/html/tree_builder.h>
#include <sleek/url/url.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::proxy {

inline constexpr std::string_view kDefaultMount = "/proxy";

// data:, javascript:, mailto:, tel: and fragment-only values stay as they
// are. Case-insensitive, leading whitespace ignored.
bool is_skipped_value(std::string_view value);

// Resolves `value` against `base` and wraps it as <mount>?url=<encoded>.
// Empty, skipped or unresolvable values come back unchanged.
std::string resolve_and_proxy(const url::URL& base, std::string_view value,
                              std::string_view mount = kDefaultMount);
std::string resolve_and_proxy(std::string_view base, std::string_view value,
                              std::string_view mount = kDefaultMount);

// Rewrites every candidate URL of a srcset value, keeping descriptors.
std::string rewrite_srcset(const url::URL& base, std::string_view srcset,
                           std::string_view mount = kDefaultMount);

// ---------------------------------------------------------------------------
// Target validation
// ---------------------------------------------------------------------------

struct ResolvedTarget {
    url::URL url;
    std::string scheme;
    std::string hostname;  // brackets stripped for IPv6 literals
    std::string origin;
    std::string href;
};

struct TargetParse {
    std::optional<ResolvedTarget> target;
    std::string message;  // set when target is empty
};

// Absolute http(s) URL with a host, or a message suitable for a 400 body.
TargetParse parse_target(std::string_view raw);

// ---------------------------------------------------------------------------
// Document rewriting
// ---------------------------------------------------------------------------

struct RewriteContext {
    url::URL base;
    std::string mount_path = std::string(kDefaultMount);
};

struct RewriteStats {
    size_t links = 0;
    size_t resources = 0;
    size_t stylesheets = 0;
    size_t srcsets = 0;
    size_t csp_removed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    // content= of each removed policy, for the warning log
    std::vector<std::string> removed_policies;
    // Set when a <base href> replaced the request URL as resolution base
    std::optional<std::string> document_base;
};

RewriteStats rewrite_document(html::SimpleNode& document, const RewriteContext& context);

} // namespace sleek::proxy
