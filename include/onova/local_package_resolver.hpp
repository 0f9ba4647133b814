#pragma once

#include "onova/package_resolver.hpp"
#include "onova/storage_layout.hpp"

#include <optional>
#include <string>

namespace onova {

// Resolves packages from a local or mounted directory holding
// "{version}.{ext}" files. A "{version}.{ext}.sha256" sidecar, when present,
// is checked against the copied bytes.
class LocalPackageResolver final : public IPackageResolver {
  public:
    explicit LocalPackageResolver(std::string repository_dir,
                                  std::string package_extension = kDefaultPackageExtension);

    Result GetPackageVersions(const CancelToken& cancel, std::vector<Version>& out) override;

    Result DownloadPackage(const Version& version,
                           const std::string& destination_path,
                           IProgress* progress,
                           const CancelToken& cancel) override;

    const std::string& RepositoryDir() const { return repository_dir_; }

  private:
    std::optional<std::string> FindPackageFile(const Version& version) const;

    std::string repository_dir_;
    std::string package_extension_;
};

} // namespace onova
