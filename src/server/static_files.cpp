#include <sleek/server/static_files.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace sleek::server {

namespace fs = std::filesystem;

std::string mime_type_for(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".css")  return "text/css; charset=utf-8";
    if (ext == ".js" || ext == ".mjs") return "text/javascript; charset=utf-8";
    if (ext == ".json") return "application/json";
    if (ext == ".txt")  return "text/plain; charset=utf-8";
    if (ext == ".svg")  return "image/svg+xml";
    if (ext == ".png")  return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif")  return "image/gif";
    if (ext == ".webp") return "image/webp";
    if (ext == ".ico")  return "image/x-icon";
    if (ext == ".woff") return "font/woff";
    if (ext == ".woff2") return "font/woff2";
    if (ext == ".webmanifest") return "application/manifest+json";
    return "application/octet-stream";
}

StaticFiles::StaticFiles(fs::path root) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root, ec);
    root_ = ec ? root.lexically_normal() : canonical;
    if (root_.has_parent_path() && root_.filename().empty()) {
        root_ = root_.parent_path();
    }
}

std::optional<StaticFile> StaticFiles::resolve(std::string_view url_path) const {
    if (url_path.empty() || url_path.front() != '/') return std::nullopt;
    if (url_path.find('\0') != std::string_view::npos) return std::nullopt;

    // Reject any ".." segment outright, then confirm containment after
    // symlinks are resolved
    std::string relative(url_path.substr(1));
    std::istringstream segments(relative);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == ".." || segment.find('\\') != std::string::npos) return std::nullopt;
    }

    std::error_code ec;
    fs::path candidate = (root_ / relative).lexically_normal();
    if (fs::is_directory(candidate, ec)) {
        candidate /= "index.html";
    }
    if (!fs::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }

    fs::path real = fs::canonical(candidate, ec);
    if (ec) return std::nullopt;
    auto [root_end, real_it] = std::mismatch(root_.begin(), root_.end(), real.begin(), real.end());
    if (root_end != root_.end()) {
        return std::nullopt;
    }

    return StaticFile{real, mime_type_for(real)};
}

std::optional<std::string> StaticFiles::load(const StaticFile& file) {
    std::ifstream in(file.path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return contents;
}

} // namespace sleek::server
