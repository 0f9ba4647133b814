#include "onova/check_result.hpp"

#include <algorithm>

namespace onova {

CheckForUpdatesResult CheckForUpdatesResult::From(std::vector<Version> versions,
                                                  const Version& current) {
    CheckForUpdatesResult out;
    if (!versions.empty()) {
        out.last_version = *std::max_element(versions.begin(), versions.end());
    }
    out.can_update = out.last_version.has_value() && current < *out.last_version;
    out.versions = std::move(versions);
    return out;
}

} // namespace onova
