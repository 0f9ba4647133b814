#pragma once

#include "onova/version.hpp"
#include "util/result.hpp"

#include <string>

namespace onova {

// Native executables carry no file suffix on Linux.
inline constexpr const char kExecutableSuffix[] = "";

inline constexpr const char kLockFileName[] = "Onova.lock";
inline constexpr const char kDefaultPackageExtension[] = "onv";

// Paths inside {root}/{app_name}/.
class StorageLayout {
  public:
    StorageLayout(std::string root_dir, std::string app_name,
                  std::string package_extension = kDefaultPackageExtension);

    // $XDG_DATA_HOME/Onova, else $HOME/.local/share/Onova, else /tmp/Onova.
    static std::string DefaultRoot();

    const std::string& AppName() const { return app_name_; }
    const std::string& StorageDir() const { return storage_dir_; }

    std::string PackageFilePath(const Version& version) const;
    std::string PackageContentDirPath(const Version& version) const;
    std::string UpdaterFilePath() const;
    std::string UpdaterConfigPath() const;
    std::string LockFilePath() const;
    std::string ManagerLogPath() const;

    Result EnsureStorageDir() const;

  private:
    std::string app_name_;
    std::string storage_dir_;
    std::string package_extension_;
};

// Deletes path recursively if present and recreates it empty.
Result ResetDirectory(const std::string& path);

} // namespace onova
