#include <sleek/core/config.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace sleek::core {

namespace {

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_copy(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(start, end - start));
}

template <typename T>
bool parse_unsigned(std::string_view text, T& value) {
    if (text.empty()) {
        return false;
    }
    T parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }
    value = parsed;
    return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

ConfigResult fail(std::string message) {
    return ConfigResult{false, std::move(message)};
}

ConfigResult set_port(ProxyConfig& config, const std::string& source, const std::string& text) {
    std::uint32_t port = 0;
    if (!parse_unsigned(text, port) || port == 0 || port > 65535) {
        return fail("Invalid " + source + ": '" + text + "' (expected 1-65535)");
    }
    config.port = static_cast<std::uint16_t>(port);
    return {};
}

ConfigResult set_timeout(ProxyConfig& config, const std::string& source, const std::string& text) {
    std::uint64_t ms = 0;
    if (!parse_unsigned(text, ms) || ms == 0) {
        return fail("Invalid " + source + ": '" + text + "' (expected positive milliseconds)");
    }
    config.upstream_timeout = std::chrono::milliseconds(ms);
    return {};
}

ConfigResult set_mount(ProxyConfig& config, const std::string& source, const std::string& text) {
    if (text.empty() || text.front() != '/' || text.find_first_of("?#") != std::string::npos) {
        return fail("Invalid " + source + ": '" + text + "' (expected an absolute path)");
    }
    config.mount_path = text;
    return {};
}

ConfigResult set_workers(ProxyConfig& config, const std::string& source, const std::string& text) {
    std::size_t workers = 0;
    if (!parse_unsigned(text, workers) || workers == 0) {
        return fail("Invalid " + source + ": '" + text + "' (expected a positive integer)");
    }
    config.worker_threads = workers;
    return {};
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::vector<std::string> split_host_list(const std::string& text) {
    std::vector<std::string> hosts;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string entry = to_lower_ascii(trim_copy(std::string_view(text).substr(pos, comma - pos)));
        if (!entry.empty()) {
            hosts.push_back(std::move(entry));
        }
        pos = comma + 1;
    }
    return hosts;
}

bool parse_bool(const std::string& text, bool& out) {
    const std::string lower = to_lower_ascii(trim_copy(text));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

ConfigResult apply_environment(ProxyConfig& config, const EnvLookup& lookup) {
    if (auto v = lookup("SLEEK_HOST")) {
        if (v->empty()) return fail("Invalid SLEEK_HOST: empty");
        config.listen_host = *v;
    }
    // PORT is what hosting platforms set; SLEEK_PORT wins when both exist.
    if (auto v = lookup("PORT")) {
        auto result = set_port(config, "PORT", *v);
        if (!result.ok) return result;
    }
    if (auto v = lookup("SLEEK_PORT")) {
        auto result = set_port(config, "SLEEK_PORT", *v);
        if (!result.ok) return result;
    }
    if (auto v = lookup("SLEEK_MOUNT_PATH")) {
        auto result = set_mount(config, "SLEEK_MOUNT_PATH", *v);
        if (!result.ok) return result;
    }
    if (auto v = lookup("SLEEK_ALLOWED_HOSTS")) {
        config.allowed_hosts = split_host_list(*v);
    }
    if (auto v = lookup("SLEEK_BLOCK_PRIVATE")) {
        if (!parse_bool(*v, config.block_private_addresses)) {
            return fail("Invalid SLEEK_BLOCK_PRIVATE: '" + *v + "' (expected true/false)");
        }
    }
    if (auto v = lookup("SLEEK_TIMEOUT_MS")) {
        auto result = set_timeout(config, "SLEEK_TIMEOUT_MS", *v);
        if (!result.ok) return result;
    }
    if (auto v = lookup("SLEEK_USER_AGENT")) {
        if (!v->empty()) config.default_user_agent = *v;
    }
    if (auto v = lookup("SLEEK_MAX_DOCUMENT_BYTES")) {
        std::size_t bytes = 0;
        if (!parse_unsigned(*v, bytes) || bytes == 0) {
            return fail("Invalid SLEEK_MAX_DOCUMENT_BYTES: '" + *v + "'");
        }
        config.max_document_bytes = bytes;
    }
    if (auto v = lookup("SLEEK_PUBLIC_DIR")) {
        config.public_dir = *v;
    }
    if (auto v = lookup("SLEEK_BASIC_AUTH")) {
        if (!v->empty()) {
            auto colon = v->find(':');
            if (colon == std::string::npos || colon == 0) {
                return fail("Invalid SLEEK_BASIC_AUTH: expected user:password");
            }
            config.basic_auth = BasicCredentials{v->substr(0, colon), v->substr(colon + 1)};
        }
    }
    if (auto v = lookup("SLEEK_RATE_LIMIT")) {
        std::uint32_t limit = 0;
        if (!parse_unsigned(*v, limit)) {
            return fail("Invalid SLEEK_RATE_LIMIT: '" + *v + "' (requests per minute)");
        }
        config.rate_limit_per_minute = limit;
    }
    if (auto v = lookup("SLEEK_WORKERS")) {
        auto result = set_workers(config, "SLEEK_WORKERS", *v);
        if (!result.ok) return result;
    }
    if (auto v = lookup("SLEEK_VERIFY_TLS")) {
        if (!parse_bool(*v, config.verify_tls)) {
            return fail("Invalid SLEEK_VERIFY_TLS: '" + *v + "' (expected true/false)");
        }
    }
    if (auto v = lookup("SLEEK_LOG_LEVEL")) {
        if (!parse_severity(*v, config.log_level)) {
            return fail("Invalid SLEEK_LOG_LEVEL: '" + *v + "' (expected info, warning or error)");
        }
    }
    return {};
}

ConfigResult apply_command_line(ProxyConfig& config, const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        std::string_view text(arg);
        if (text == "--no-private-check") {
            config.block_private_addresses = false;
        } else if (text == "--insecure") {
            config.verify_tls = false;
        } else if (text == "--quiet") {
            config.log_level = Severity::Warning;
        } else if (starts_with(text, "--host=")) {
            std::string host(text.substr(7));
            if (host.empty()) return fail("Invalid --host: empty");
            config.listen_host = host;
        } else if (starts_with(text, "--port=")) {
            auto result = set_port(config, "--port", std::string(text.substr(7)));
            if (!result.ok) return result;
        } else if (starts_with(text, "--mount=")) {
            auto result = set_mount(config, "--mount", std::string(text.substr(8)));
            if (!result.ok) return result;
        } else if (starts_with(text, "--allow=")) {
            for (auto& host : split_host_list(std::string(text.substr(8)))) {
                config.allowed_hosts.push_back(std::move(host));
            }
        } else if (starts_with(text, "--timeout-ms=")) {
            auto result = set_timeout(config, "--timeout-ms", std::string(text.substr(13)));
            if (!result.ok) return result;
        } else if (starts_with(text, "--public=")) {
            config.public_dir = std::string(text.substr(9));
        } else if (starts_with(text, "--workers=")) {
            auto result = set_workers(config, "--workers", std::string(text.substr(10)));
            if (!result.ok) return result;
        } else if (starts_with(text, "--fetch=")) {
            std::string url(text.substr(8));
            if (url.empty()) return fail("Invalid --fetch: empty URL");
            config.fetch_once = url;
        } else {
            return fail("Unknown argument: '" + arg + "'");
        }
    }
    return {};
}

} // namespace sleek::core
