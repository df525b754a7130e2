#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sleek::url {

struct URL {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;           // lowercased; IPv6 literals keep their brackets
    std::optional<uint16_t> port;  // nullopt when absent or equal to the scheme default
    std::string path;
    std::string query;
    std::string fragment;

    std::string serialize() const;
    std::string origin() const;
    bool is_special() const;

    // Host without the IPv6 brackets, suitable for name resolution.
    std::string bare_host() const;
    uint16_t effective_port() const;
};

std::optional<URL> parse(std::string_view input, const URL* base = nullptr);

} // namespace sleek::url
