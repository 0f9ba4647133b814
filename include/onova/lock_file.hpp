#pragma once

#include "io/fd.hpp"

#include <optional>
#include <string>

namespace onova {

// Cross-process lock held through flock(2) on an open descriptor. The lock is
// released when the descriptor closes, including on process exit.
class LockFile {
  public:
    LockFile(LockFile&&) noexcept = default;
    LockFile& operator=(LockFile&&) noexcept = default;
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
    ~LockFile() = default;

    // Creates the file if needed and takes an exclusive lock. Never blocks:
    // returns nullopt when another holder exists.
    static std::optional<LockFile> TryAcquire(const std::string& path);

    // Takes a shared lock on an existing file. Any number of shared holders may
    // coexist; they all block exclusive acquisition.
    static std::optional<LockFile> TryAcquireShared(const std::string& path);

    // Takes a shared lock on path that stays held until the process exits.
    // Calls for a path already held are no-ops. Returns false when the lock
    // cannot be taken.
    static bool HoldSharedUntilExit(const std::string& path);

    const std::string& Path() const { return path_; }
    bool Held() const { return fd_.Valid(); }
    void Release();

  private:
    LockFile(std::string path, Fd fd) : path_(std::move(path)), fd_(std::move(fd)) {}

    std::string path_;
    Fd fd_;
};

} // namespace onova
