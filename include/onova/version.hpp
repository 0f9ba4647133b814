#pragma once

#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace onova {

// major.minor.build.revision, ordered lexicographically.
class Version {
public:
    Version() = default;
    Version(int major, int minor, int build = 0, int revision = 0);

    int Major() const { return parts_[0]; }
    int Minor() const { return parts_[1]; }
    int Build() const { return parts_[2]; }
    int Revision() const { return parts_[3]; }

    // Canonical 4-part form, e.g. "1.2.0.0". Used as the staging directory name.
    std::string ToString() const;

    // Accepts 2 to 4 dot-separated non-negative integers; missing parts are 0.
    static std::optional<Version> TryParse(std::string_view text);

    auto operator<=>(const Version& other) const = default;

private:
    std::array<int, 4> parts_{0, 0, 0, 0};
};

} // namespace onova
