#pragma once

#include "onova/progress.hpp"
#include "system/cancel.hpp"
#include "util/result.hpp"

#include <string>

namespace onova {

// Unpacks a downloaded package. destination_dir exists and is empty on entry.
class IPackageExtractor {
  public:
    virtual ~IPackageExtractor() = default;

    virtual Result ExtractPackage(const std::string& archive_path,
                                  const std::string& destination_dir,
                                  IProgress* progress,
                                  const CancelToken& cancel) = 0;
};

} // namespace onova
