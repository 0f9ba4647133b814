#pragma once

#include "onova/options.hpp"
#include "system/process_launcher.hpp"
#include "updater/updater_args.hpp"
#include "util/log_file.hpp"
#include "util/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace onova {

// Picks what to start after the files are replaced:
//   - the updatee itself when it carries the native executable suffix;
//   - otherwise a same-stem native sibling in the same directory, when
//     allowed and executable;
//   - otherwise "<runtime_host> <updatee> <args...>".
// routed_args is split with POSIX shell quoting rules.
std::expected<LaunchRequest, Result> ResolveRestartCommand(const std::string& updatee_file_path,
                                                           const std::string& routed_args,
                                                           const UpdaterOptions& options);

// Copies every entry under source_dir into dest_dir, replacing each file
// through a temporary sibling and rename. Directories are created as needed.
Result CopyDirectoryContents(const std::string& source_dir, const std::string& dest_dir);

// The detached helper: waits for the updatee to exit, copies the staged
// content over its directory, optionally restarts it and removes the staged
// content.
class Updater {
  public:
    Updater(UpdaterArgs args,
            UpdaterOptions options,
            std::shared_ptr<const IProcessLauncher> launcher = DefaultProcessLauncher());

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;

    Result OpenLog(const std::string& path, LogLevel level = LogLevel::Info);

    // Logs and swallows every failure.
    void Run();

    // Run() without the catch-all; exposed for tests.
    Result RunCore();

    const UpdaterArgs& Args() const { return args_; }
    LogFile& Log() { return log_; }

  private:
    Result AwaitWritable();
    Result Restart();

    UpdaterArgs args_;
    UpdaterOptions options_;
    std::shared_ptr<const IProcessLauncher> launcher_;
    LogFile log_;
};

} // namespace onova
