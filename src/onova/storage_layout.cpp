#include "onova/storage_layout.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace onova {

StorageLayout::StorageLayout(std::string root_dir, std::string app_name,
                             std::string package_extension)
    : app_name_(std::move(app_name)),
      storage_dir_((fs::path(root_dir) / app_name_).string()),
      package_extension_(std::move(package_extension)) {
    if (!package_extension_.empty() && package_extension_.front() == '.') {
        package_extension_.erase(0, 1);
    }
}

std::string StorageLayout::DefaultRoot() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "Onova").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".local" / "share" / "Onova").string();
    }
    return "/tmp/Onova";
}

std::string StorageLayout::PackageFilePath(const Version& version) const {
    return (fs::path(storage_dir_) / (version.ToString() + "." + package_extension_)).string();
}

std::string StorageLayout::PackageContentDirPath(const Version& version) const {
    return (fs::path(storage_dir_) / version.ToString()).string();
}

std::string StorageLayout::UpdaterFilePath() const {
    return (fs::path(storage_dir_) / (app_name_ + ".Updater" + kExecutableSuffix)).string();
}

std::string StorageLayout::UpdaterConfigPath() const {
    return UpdaterFilePath() + ".json";
}

std::string StorageLayout::LockFilePath() const {
    return (fs::path(storage_dir_) / kLockFileName).string();
}

std::string StorageLayout::ManagerLogPath() const {
    return (fs::path(storage_dir_) / (app_name_ + ".UpdateManager.log")).string();
}

Result StorageLayout::EnsureStorageDir() const {
    std::error_code ec;
    fs::create_directories(storage_dir_, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::Io,
                            "create_directories failed: " + storage_dir_ + ": " + ec.message());
    }
    return Result::Ok();
}

Result ResetDirectory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::Io, "remove_all failed: " + path + ": " + ec.message());
    }
    fs::create_directories(path, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::Io, "create_directories failed: " + path + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace onova
