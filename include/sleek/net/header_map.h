#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sleek::net {

// Case-insensitive header collection. Names are stored lowercase and
// insertion order is kept so relayed headers go out in upstream order.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;

    // Iteration
    using iterator = std::vector<Entry>::const_iterator;
    iterator begin() const;
    iterator end() const;

    static std::string normalize_name(const std::string& name);

private:
    std::vector<Entry> headers_;
};

} // namespace sleek::net
