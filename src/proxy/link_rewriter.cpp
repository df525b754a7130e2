#include <sleek/proxy/link_rewriter.h>

#include <sleek/url/percent_encoding.h>

#include <algorithm>
#include <cctype>

namespace sleek::proxy {
namespace {

constexpr std::string_view kSkippedPrefixes[] = {"data:", "javascript:", "mailto:", "tel:", "#"};

bool is_html_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_html_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_html_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string proxied(std::string_view mount, const std::string& absolute) {
    std::string out(mount);
    out += "?url=";
    out += url::encode_uri_component(absolute);
    return out;
}

enum class Outcome { Rewritten, Skipped, Failed };

// Shared by every attribute kind so the keep/proxy rule is applied once
Outcome rewrite_value(const url::URL& base, std::string_view value, std::string_view mount,
                      std::string& out) {
    if (value.empty() || is_skipped_value(value)) {
        out = std::string(value);
        return Outcome::Skipped;
    }
    auto resolved = url::parse(trim(value), &base);
    if (!resolved) {
        out = std::string(value);
        return Outcome::Failed;
    }
    out = proxied(mount, resolved->serialize());
    return Outcome::Rewritten;
}

void count(Outcome outcome, size_t& bucket, RewriteStats& stats) {
    switch (outcome) {
        case Outcome::Rewritten: ++bucket; break;
        case Outcome::Skipped:   ++stats.skipped; break;
        case Outcome::Failed:    ++stats.failed; break;
    }
}

struct SrcsetCandidate {
    std::string url;
    std::string descriptor;
};

// Candidate splitting after the HTML srcset grammar: the URL is a run of
// non-space characters and trailing commas end the candidate.
std::vector<SrcsetCandidate> split_srcset(std::string_view value) {
    std::vector<SrcsetCandidate> candidates;
    size_t pos = 0;
    while (pos < value.size()) {
        while (pos < value.size() && (is_html_space(value[pos]) || value[pos] == ',')) ++pos;
        if (pos >= value.size()) break;

        size_t url_start = pos;
        while (pos < value.size() && !is_html_space(value[pos])) ++pos;
        std::string_view url = value.substr(url_start, pos - url_start);

        SrcsetCandidate candidate;
        if (!url.empty() && url.back() == ',') {
            while (!url.empty() && url.back() == ',') url.remove_suffix(1);
            candidate.url = std::string(url);
            candidates.push_back(std::move(candidate));
            continue;
        }
        candidate.url = std::string(url);

        size_t desc_start = pos;
        int paren_depth = 0;
        while (pos < value.size()) {
            char c = value[pos];
            if (c == '(') ++paren_depth;
            else if (c == ')' && paren_depth > 0) --paren_depth;
            else if (c == ',' && paren_depth == 0) break;
            ++pos;
        }
        candidate.descriptor = std::string(trim(value.substr(desc_start, pos - desc_start)));
        if (pos < value.size()) ++pos;  // the comma
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

} // namespace

bool is_skipped_value(std::string_view value) {
    while (!value.empty() && is_html_space(value.front())) value.remove_prefix(1);
    for (std::string_view prefix : kSkippedPrefixes) {
        if (value.size() >= prefix.size() && iequals(value.substr(0, prefix.size()), prefix)) {
            return true;
        }
    }
    return false;
}

std::string resolve_and_proxy(const url::URL& base, std::string_view value,
                              std::string_view mount) {
    std::string out;
    rewrite_value(base, value, mount, out);
    return out;
}

std::string resolve_and_proxy(std::string_view base, std::string_view value,
                              std::string_view mount) {
    auto parsed = url::parse(base);
    if (!parsed) return std::string(value);
    return resolve_and_proxy(*parsed, value, mount);
}

std::string rewrite_srcset(const url::URL& base, std::string_view srcset,
                           std::string_view mount) {
    std::string out;
    for (const auto& candidate : split_srcset(srcset)) {
        if (!out.empty()) out += ", ";
        out += resolve_and_proxy(base, candidate.url, mount);
        if (!candidate.descriptor.empty()) {
            out += ' ';
            out += candidate.descriptor;
        }
    }
    return out;
}

TargetParse parse_target(std::string_view raw) {
    TargetParse result;
    std::string_view text = trim(raw);

    auto parsed = url::parse(text);
    if (!parsed) {
        result.message = "Invalid URL: " + std::string(text);
        return result;
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        result.message = "Only http(s) URLs are supported. Include http:// or https://";
        return result;
    }
    if (parsed->host.empty()) {
        result.message = "Invalid URL: missing host";
        return result;
    }

    ResolvedTarget target;
    target.scheme = parsed->scheme;
    target.hostname = parsed->bare_host();
    target.origin = parsed->origin();
    target.href = parsed->serialize();
    target.url = std::move(*parsed);
    result.target = std::move(target);
    return result;
}

// ---------------------------------------------------------------------------
// rewrite_document
// ---------------------------------------------------------------------------

RewriteStats rewrite_document(html::SimpleNode& document, const RewriteContext& context) {
    RewriteStats stats;
    std::vector<html::SimpleNode*> doomed;

    // The first <base href> re-bases the whole document
    url::URL base = context.base;
    bool base_seen = false;
    html::for_each_element(document, [&](html::SimpleNode& el) {
        if (el.tag_name != "base") return;
        const std::string* href = el.get_attribute("href");
        if (href == nullptr) return;
        if (!base_seen) {
            base_seen = true;
            if (auto resolved = url::parse(trim(*href), &context.base)) {
                base = std::move(*resolved);
                stats.document_base = base.serialize();
            }
        }
        doomed.push_back(&el);
    });

    const std::string_view mount = context.mount_path;
    std::string rewritten;

    html::for_each_element(document, [&](html::SimpleNode& el) {
        if (el.tag_name == "a") {
            const std::string* href = el.get_attribute("href");
            if (href != nullptr && !href->empty()) {
                count(rewrite_value(base, *href, mount, rewritten), stats.links, stats);
                el.set_attribute("href", rewritten);
                el.set_attribute("rel", "noreferrer noopener");
            }
        }

        if (const std::string* src = el.get_attribute("src"); src != nullptr && !src->empty()) {
            count(rewrite_value(base, *src, mount, rewritten), stats.resources, stats);
            el.set_attribute("src", rewritten);
        }

        if (el.tag_name == "link") {
            const std::string* href = el.get_attribute("href");
            if (href != nullptr && !href->empty()) {
                count(rewrite_value(base, *href, mount, rewritten), stats.stylesheets, stats);
                el.set_attribute("href", rewritten);
            }
        }

        if (el.tag_name == "img" || el.tag_name == "source") {
            const std::string* srcset = el.get_attribute("srcset");
            if (srcset != nullptr && !trim(*srcset).empty()) {
                el.set_attribute("srcset", rewrite_srcset(base, *srcset, mount));
                ++stats.srcsets;
            }
        }

        if (el.tag_name == "meta") {
            const std::string* equiv = el.get_attribute("http-equiv");
            if (equiv != nullptr && iequals(trim(*equiv), "content-security-policy")) {
                const std::string* content = el.get_attribute("content");
                stats.removed_policies.push_back(content != nullptr ? *content : std::string());
                ++stats.csp_removed;
                doomed.push_back(&el);
            }
        }
    });

    for (html::SimpleNode* node : doomed) {
        if (node->parent != nullptr) {
            node->parent->remove_child(node);
        }
    }

    return stats;
}

} // namespace sleek::proxy
