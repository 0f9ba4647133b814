#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace onova::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

// Writes pretty-printed JSON through a temp file and rename.
Result SaveJsonToFile(const std::string& path, const nlohmann::json& j);

// The Get*IfPresent helpers leave out untouched when key is absent and fail
// with UpdateErrc::Config when it holds the wrong type.
Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
Result GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);
Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);
Result GetMillisIfPresent(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out);

} // namespace onova::config::detail
