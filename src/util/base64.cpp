#include "util/base64.hpp"

#include <openssl/evp.h>

#include <vector>

namespace onova {

std::string Base64Encode(std::string_view bytes) {
    if (bytes.empty()) return {};

    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

std::expected<std::string, std::string> Base64Decode(std::string_view text) {
    if (text.empty()) return std::string();
    if (text.size() % 4 != 0) {
        return std::unexpected("base64 length must be a multiple of 4");
    }

    // Padding only as "x=" or "==" at the very end.
    const size_t first_pad = text.find('=');
    if (first_pad != std::string_view::npos) {
        if (first_pad < text.size() - 2 || text.back() != '=') {
            return std::unexpected("misplaced base64 padding");
        }
    }

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) {
        return std::unexpected("invalid base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    size_t len = static_cast<size_t>(n);
    if (text.back() == '=') --len;
    if (text.size() >= 2 && text[text.size() - 2] == '=') --len;

    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

} // namespace onova
