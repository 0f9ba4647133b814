#include "io/file_access.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <fcntl.h>
#include <future>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace onova {

bool CheckWriteAccess(const std::string& file_path) {
    Fd fd(::open(file_path.c_str(), O_WRONLY | O_CLOEXEC | O_NOCTTY));
    if (!fd.Valid()) return false;

    if (::flock(fd.Get(), LOCK_EX | LOCK_NB) != 0) return false;
    (void)::flock(fd.Get(), LOCK_UN);
    return true;
}

bool CheckDirectoryWriteAccess(const std::string& dir_path) {
    std::string tmpl = dir_path + "/.onova-probe-XXXXXX";
    const int fd = ::mkstemp(tmpl.data());
    if (fd < 0) return false;

    ::close(fd);
    ::unlink(tmpl.c_str());
    return true;
}

Result WaitForWriteAccess(const std::string& file_path, const WaitOptions& opt) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + opt.timeout;
    const auto interval =
        opt.poll_interval.count() > 0 ? opt.poll_interval : std::chrono::milliseconds(100);

    while (!CheckWriteAccess(file_path)) {
        if (opt.timeout.count() > 0 && clock::now() >= deadline) {
            return Result::Fail(UpdateErrc::StillHeld,
                                "file is still held by another process: " + file_path);
        }
        std::this_thread::sleep_for(interval);
    }
    LogDebug("write access available: %s", file_path.c_str());
    return Result::Ok();
}

Result WaitForWriteAccessAll(const std::vector<std::string>& file_paths, const WaitOptions& opt) {
    std::vector<std::future<Result>> probes;
    probes.reserve(file_paths.size());
    for (const auto& path : file_paths) {
        probes.push_back(std::async(std::launch::async, [path, opt]() {
            return WaitForWriteAccess(path, opt);
        }));
    }

    Result first = Result::Ok();
    for (auto& probe : probes) {
        Result r = probe.get();
        if (!r.is_ok() && first.is_ok()) {
            first = std::move(r);
        }
    }
    return first;
}

} // namespace onova
