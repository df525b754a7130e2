#include <sleek/server/http_request.h>

#include <sleek/url/percent_encoding.h>

namespace sleek::server {
namespace {

bool is_token_char(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|':
        case '~':
            return true;
        default:
            return false;
    }
}

std::string_view trim_ows(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<std::string> HttpRequest::query_parameter(std::string_view name) const {
    return url::find_query_parameter(query, name);
}

ParseStatus parse_request_head(std::string_view data, HttpRequest& out, size_t& consumed) {
    // Locate the blank line; bare LF line endings are tolerated
    size_t head_end = std::string_view::npos;
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] != '\n') continue;
        if (i + 1 < data.size() && data[i + 1] == '\n') { head_end = i + 2; break; }
        if (i + 2 < data.size() && data[i + 1] == '\r' && data[i + 2] == '\n') {
            head_end = i + 3;
            break;
        }
    }
    if (head_end == std::string_view::npos) {
        return data.size() > kMaxRequestHeadBytes ? ParseStatus::TooLarge
                                                  : ParseStatus::Incomplete;
    }
    if (head_end > kMaxRequestHeadBytes) {
        return ParseStatus::TooLarge;
    }

    HttpRequest request;
    std::string_view head = data.substr(0, head_end);
    size_t pos = 0;
    auto next_line = [&head, &pos]() {
        size_t lf = head.find('\n', pos);
        std::string_view line = head.substr(pos, lf - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        pos = lf + 1;
        return line;
    };

    // Request line: METHOD SP target SP HTTP/x.y
    std::string_view line = next_line();
    size_t sp1 = line.find(' ');
    size_t sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == 0 || sp2 == std::string_view::npos || sp2 == sp1 + 1 ||
        line.find(' ', sp2 + 1) != std::string_view::npos) {
        return ParseStatus::Invalid;
    }
    std::string_view method = line.substr(0, sp1);
    for (char c : method) {
        if (!is_token_char(c)) return ParseStatus::Invalid;
    }
    std::string_view version = line.substr(sp2 + 1);
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return ParseStatus::Invalid;
    }
    request.method = std::string(method);
    request.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    request.version = std::string(version);

    // Origin-form only; absolute-form would make this an open forward proxy
    if (request.target.empty() || request.target.front() != '/') {
        return ParseStatus::Invalid;
    }
    size_t q = request.target.find('?');
    std::string_view raw_path = std::string_view(request.target).substr(0, q);
    request.path = url::percent_decode(raw_path);
    if (q != std::string::npos) {
        request.query = request.target.substr(q + 1);
    }

    while (pos < head.size()) {
        line = next_line();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return ParseStatus::Invalid;
        }
        std::string_view name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(c)) return ParseStatus::Invalid;
        }
        request.headers.append(std::string(name),
                               std::string(trim_ows(line.substr(colon + 1))));
    }

    out = std::move(request);
    consumed = head_end;
    return ParseStatus::Complete;
}

} // namespace sleek::server
