#pragma once

#include "onova/package_extractor.hpp"

namespace onova {

// Unpacks any archive libarchive can read (zip, tar, tar.gz, tar.xz, ...).
class ArchivePackageExtractor final : public IPackageExtractor {
  public:
    Result ExtractPackage(const std::string& archive_path,
                          const std::string& destination_dir,
                          IProgress* progress,
                          const CancelToken& cancel) override;
};

} // namespace onova
