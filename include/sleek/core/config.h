#pragma once

#include <sleek/core/diagnostics.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sleek::core {

namespace config {

inline constexpr std::uint16_t kDefaultPort = 3000;
inline constexpr const char kDefaultListenHost[] = "0.0.0.0";
inline constexpr const char kDefaultMountPath[] = "/proxy";
inline constexpr const char kServerlessMountPath[] = "/.netlify/functions/proxy";
inline constexpr const char kDefaultUserAgent[] = "SleekProxy/1.0";
inline constexpr const char kDefaultPublicDir[] = "public";
inline constexpr std::chrono::milliseconds kDefaultUpstreamTimeout{20000};
inline constexpr std::size_t kDefaultMaxDocumentBytes = 10 * 1024 * 1024;
inline constexpr const char kVersionString[] = "sleekproxy 1.0.0";

} // namespace config

struct BasicCredentials {
    std::string user;
    std::string password;
};

struct ProxyConfig {
    std::string listen_host = config::kDefaultListenHost;
    std::uint16_t port = config::kDefaultPort;
    std::string mount_path = config::kDefaultMountPath;

    // Empty means every public host is reachable.
    std::vector<std::string> allowed_hosts;
    bool block_private_addresses = true;

    std::chrono::milliseconds upstream_timeout = config::kDefaultUpstreamTimeout;
    std::string default_user_agent = config::kDefaultUserAgent;
    std::size_t max_document_bytes = config::kDefaultMaxDocumentBytes;
    bool verify_tls = true;

    std::string public_dir = config::kDefaultPublicDir;
    std::optional<BasicCredentials> basic_auth;
    std::uint32_t rate_limit_per_minute = 0;
    std::size_t worker_threads = 0;  // 0: hardware concurrency

    Severity log_level = Severity::Info;

    // One-shot mode: fetch this URL, print the function envelope, exit.
    std::optional<std::string> fetch_once;
};

struct ConfigResult {
    bool ok = true;
    std::string message;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads process environment variables.
EnvLookup process_environment();

ConfigResult apply_environment(ProxyConfig& config, const EnvLookup& lookup);

// Flags of the form --name=value or bare switches. Stops at the first error.
ConfigResult apply_command_line(ProxyConfig& config, const std::vector<std::string>& args);

// Splits "a, b,,c" into {"a", "b", "c"}, lowercased.
std::vector<std::string> split_host_list(const std::string& text);

bool parse_bool(const std::string& text, bool& out);

} // namespace sleek::core
