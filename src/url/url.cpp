#include <sleek/url/url.h>
#include <string>

namespace sleek::url {

bool URL::is_special() const {
    return scheme == "http" || scheme == "https" ||
           scheme == "ftp" || scheme == "ws" ||
           scheme == "wss" || scheme == "file";
}

std::string URL::serialize() const {
    std::string result;
    result += scheme;
    result += ':';

    if (!host.empty() || scheme == "file") {
        result += "//";

        if (!username.empty() || !password.empty()) {
            result += username;
            if (!password.empty()) {
                result += ':';
                result += password;
            }
            result += '@';
        }

        result += host;

        if (port.has_value()) {
            result += ':';
            result += std::to_string(port.value());
        }
    } else if (is_special()) {
        result += "//";
    }

    result += path;

    if (!query.empty()) {
        result += '?';
        result += query;
    }

    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }

    return result;
}

std::string URL::origin() const {
    // file: and non-special schemes have an opaque origin
    if (scheme == "file" || !is_special()) {
        return "null";
    }

    std::string result;
    result += scheme;
    result += "://";
    result += host;

    if (port.has_value()) {
        result += ':';
        result += std::to_string(port.value());
    }

    return result;
}

std::string URL::bare_host() const {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

uint16_t URL::effective_port() const {
    if (port.has_value()) return port.value();
    if (scheme == "https" || scheme == "wss") return 443;
    if (scheme == "ftp") return 21;
    return 80;
}

} // namespace sleek::url
