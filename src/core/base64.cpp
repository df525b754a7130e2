#include <sleek/core/base64.h>

#include <openssl/evp.h>

namespace sleek::core {

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (padding == 1 && text[text.size() - 2] == '=') ++padding;
    if (text.substr(0, text.size() - padding).find('=') != std::string_view::npos) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    // EVP_DecodeBlock counts the bytes that padding stands for
    if (written < 0 || static_cast<size_t>(written) < padding) return std::nullopt;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace sleek::core
