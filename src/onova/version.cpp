#include "onova/version.hpp"

#include <charconv>
#include <ranges>

namespace onova {

Version::Version(int major, int minor, int build, int revision)
    : parts_{major, minor, build, revision} {}

std::string Version::ToString() const {
    return std::to_string(parts_[0]) + "." + std::to_string(parts_[1]) + "." +
           std::to_string(parts_[2]) + "." + std::to_string(parts_[3]);
}

std::optional<Version> Version::TryParse(std::string_view text) {
    Version out;
    size_t count = 0;

    for (auto&& rng : text | std::views::split('.')) {
        const std::string_view sv(rng.begin(), rng.end());
        if (count >= out.parts_.size() || sv.empty()) return std::nullopt;

        int value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc() || ptr != sv.data() + sv.size() || value < 0) {
            return std::nullopt;
        }
        out.parts_[count++] = value;
    }

    if (count < 2) return std::nullopt;
    return out;
}

} // namespace onova
