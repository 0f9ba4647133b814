#pragma once

#include "onova/version.hpp"

#include <optional>
#include <vector>

namespace onova {

struct CheckForUpdatesResult {
    std::vector<Version> versions;
    std::optional<Version> last_version;
    bool can_update = false;

    // last_version = max(versions); can_update iff last_version > current.
    static CheckForUpdatesResult From(std::vector<Version> versions, const Version& current);
};

} // namespace onova
