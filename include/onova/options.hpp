#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>

namespace onova {

// Runtime options of the helper process, persisted next to the helper binary
// as "<helper>.json".
struct UpdaterOptions {
    // Zero waits without bound for the host to release its files.
    std::chrono::milliseconds wait_timeout{0};
    std::chrono::milliseconds poll_interval{100};
    std::string runtime_host = "dotnet";
    bool allow_sibling_executable = true;
    std::string elevation_command = "pkexec";
};

struct ManagerOptions {
    std::string storage_root;            // empty: StorageLayout::DefaultRoot()
    std::string package_extension = "onv";
    std::string updater_source_path;     // empty: onova-updater beside the host
    LogLevel log_level = LogLevel::Info;
    UpdaterOptions updater;
};

// Keys absent from the file keep the values already in out.
Result LoadManagerOptionsFromFile(const std::string& path, ManagerOptions& out);

Result SaveUpdaterConfig(const std::string& path, const UpdaterOptions& opt, LogLevel level);
Result LoadUpdaterConfigFromFile(const std::string& path, UpdaterOptions& out, LogLevel& level);

const char* LogLevelName(LogLevel lvl);

} // namespace onova
