#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sleek::server {

struct StaticFile {
    std::filesystem::path path;
    std::string content_type;
};

std::string mime_type_for(const std::filesystem::path& path);

// Serves files below a root directory. Paths that climb out of the root or
// name missing files resolve to nothing.
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    // `url_path` is the percent-decoded request path. Directories map to
    // their index.html.
    std::optional<StaticFile> resolve(std::string_view url_path) const;

    // Whole file contents; nullopt when the file cannot be read
    static std::optional<std::string> load(const StaticFile& file);

private:
    std::filesystem::path root_;
};

} // namespace sleek::server
