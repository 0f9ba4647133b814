#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace onova {

// Standard padded base64 (RFC 4648) over raw bytes.
std::string Base64Encode(std::string_view bytes);
std::expected<std::string, std::string> Base64Decode(std::string_view text);

} // namespace onova
