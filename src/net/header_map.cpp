#include <sleek/net/header_map.h>
#include <algorithm>
#include <cctype>

namespace sleek::net {

std::string HeaderMap::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto key = normalize_name(name);
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&key](const Entry& e) { return e.first == key; });
    if (it == headers_.end()) {
        headers_.emplace_back(std::move(key), value);
        return;
    }
    // Replace the first occurrence in place, drop the rest
    it->second = value;
    headers_.erase(std::remove_if(std::next(it), headers_.end(),
                                  [&key](const Entry& e) { return e.first == key; }),
                   headers_.end());
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    headers_.emplace_back(normalize_name(name), value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto key = normalize_name(name);
    for (const auto& [k, v] : headers_) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    auto key = normalize_name(name);
    std::vector<std::string> result;
    for (const auto& [k, v] : headers_) {
        if (k == key) result.push_back(v);
    }
    return result;
}

bool HeaderMap::has(const std::string& name) const {
    auto key = normalize_name(name);
    return std::any_of(headers_.begin(), headers_.end(),
                       [&key](const Entry& e) { return e.first == key; });
}

void HeaderMap::remove(const std::string& name) {
    auto key = normalize_name(name);
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&key](const Entry& e) { return e.first == key; }),
                   headers_.end());
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

HeaderMap::iterator HeaderMap::begin() const {
    return headers_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return headers_.end();
}

} // namespace sleek::net
