#include <sleek/net/response.h>
#include <charconv>
#include <string>
#include <string_view>

namespace sleek::net {

namespace {

std::string_view trim_ows(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
    size_t end = s.size();
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t')) --end;
    return s.substr(start, end - start);
}

// Next line without its terminator; accepts bare \n as well as \r\n
std::string_view next_line(std::string_view text, size_t& pos) {
    size_t lf = text.find('\n', pos);
    size_t end = lf == std::string_view::npos ? text.size() : lf;
    std::string_view line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    pos = lf == std::string_view::npos ? text.size() : lf + 1;
    return line;
}

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

} // anonymous namespace

std::optional<Response> Response::parse_head(std::string_view head) {
    size_t pos = 0;
    std::string_view status_line = next_line(head, pos);

    // "HTTP/1.1 200 OK"; the reason phrase may be absent
    if (status_line.size() < 12 || status_line.substr(0, 5) != "HTTP/") {
        return std::nullopt;
    }
    auto sp1 = status_line.find(' ');
    if (sp1 == std::string_view::npos || sp1 + 4 > status_line.size()) {
        return std::nullopt;
    }
    std::string_view code_str = status_line.substr(sp1 + 1, 3);
    if (sp1 + 4 < status_line.size() && status_line[sp1 + 4] != ' ') {
        return std::nullopt;
    }

    Response resp;
    unsigned code = 0;
    auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), code);
    if (ec != std::errc{} || ptr != code_str.data() + code_str.size() || code < 100) {
        return std::nullopt;
    }
    resp.status = static_cast<uint16_t>(code);
    if (sp1 + 5 <= status_line.size()) {
        resp.status_text = std::string(status_line.substr(sp1 + 5));
    }

    std::string last_name;
    while (pos < head.size()) {
        std::string_view line = next_line(head, pos);
        if (line.empty()) break;

        if (line.front() == ' ' || line.front() == '\t') {
            // Continuation of the previous header value
            if (last_name.empty()) return std::nullopt;
            auto values = resp.headers.get_all(last_name);
            std::string joined = values.empty() ? std::string() : values.back();
            joined += ' ';
            joined += trim_ows(line);
            // Re-append so the folded value replaces the last occurrence
            resp.headers.remove(last_name);
            for (size_t i = 0; i + 1 < values.size(); ++i) {
                resp.headers.append(last_name, values[i]);
            }
            resp.headers.append(last_name, joined);
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }
        std::string_view name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(c)) return std::nullopt;
        }
        last_name = std::string(name);
        resp.headers.append(last_name, std::string(trim_ows(line.substr(colon + 1))));
    }

    return resp;
}

std::string Response::content_type() const {
    return headers.get("content-type").value_or("");
}

bool Response::has_body(Method request_method) const {
    if (request_method == Method::HEAD) return false;
    if (status < 200 || status == 204 || status == 304) return false;
    return true;
}

} // namespace sleek::net
