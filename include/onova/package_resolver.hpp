#pragma once

#include "onova/progress.hpp"
#include "onova/version.hpp"
#include "system/cancel.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace onova {

// Discovers and fetches packages.
class IPackageResolver {
  public:
    virtual ~IPackageResolver() = default;

    virtual Result GetPackageVersions(const CancelToken& cancel, std::vector<Version>& out) = 0;

    // Writes the whole package to destination_path or fails leaving no file there.
    virtual Result DownloadPackage(const Version& version,
                                   const std::string& destination_path,
                                   IProgress* progress,
                                   const CancelToken& cancel) = 0;
};

} // namespace onova
