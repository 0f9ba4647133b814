#pragma once

#include "util/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace onova {

// True when the file can be opened for writing and exclusively flocked right
// now. Fails while the file is a running executable (ETXTBSY) or while any
// process holds a flock on it.
bool CheckWriteAccess(const std::string& file_path);

// True when a file can be created inside dir_path.
bool CheckDirectoryWriteAccess(const std::string& dir_path);

struct WaitOptions {
    std::chrono::milliseconds poll_interval{100};
    // Zero waits without bound.
    std::chrono::milliseconds timeout{0};
};

// Polls CheckWriteAccess until it succeeds. Fails with StillHeld on timeout.
Result WaitForWriteAccess(const std::string& file_path, const WaitOptions& opt);

// Runs one WaitForWriteAccess per file concurrently and returns once all of
// them have finished. The first failure, if any, is returned.
Result WaitForWriteAccessAll(const std::vector<std::string>& file_paths, const WaitOptions& opt);

} // namespace onova
