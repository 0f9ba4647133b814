#include "onova/lock_file.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <sys/file.h>

namespace onova {

namespace {

bool TryFlock(int fd, int op) {
    while (::flock(fd, op | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        return false;
    }
    return true;
}

} // namespace

std::optional<LockFile> LockFile::TryAcquire(const std::string& path) {
    Fd fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        LogDebug("lock open failed: %s (%s)", path.c_str(), std::strerror(errno));
        return std::nullopt;
    }
    if (!TryFlock(fd.Get(), LOCK_EX)) {
        LogDebug("lock busy: %s", path.c_str());
        return std::nullopt;
    }
    return LockFile(path, std::move(fd));
}

std::optional<LockFile> LockFile::TryAcquireShared(const std::string& path) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return std::nullopt;
    }
    if (!TryFlock(fd.Get(), LOCK_SH)) {
        return std::nullopt;
    }
    return LockFile(path, std::move(fd));
}

bool LockFile::HoldSharedUntilExit(const std::string& path) {
    struct Held {
        std::mutex mu;
        std::map<std::string, LockFile> locks;
    };
    // Never destroyed; the descriptors close when the process exits.
    static Held* held = new Held;

    std::lock_guard<std::mutex> lk(held->mu);
    if (held->locks.contains(path)) return true;

    auto lock = TryAcquireShared(path);
    if (!lock) return false;
    held->locks.emplace(path, std::move(*lock));
    return true;
}

void LockFile::Release() {
    fd_.Close();
}

} // namespace onova
