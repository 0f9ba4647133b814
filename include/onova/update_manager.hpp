#pragma once

#include "onova/assembly_metadata.hpp"
#include "onova/check_result.hpp"
#include "onova/lock_file.hpp"
#include "onova/options.hpp"
#include "onova/package_extractor.hpp"
#include "onova/package_resolver.hpp"
#include "onova/storage_layout.hpp"
#include "onova/updater_binary_source.hpp"
#include "system/cancel.hpp"
#include "system/process_launcher.hpp"
#include "util/log_file.hpp"
#include "util/result.hpp"

#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace onova {

// Discovers, stages and applies updates for one application. Mutating
// operations take the per-application storage lock on first use and keep it
// until Dispose().
class UpdateManager {
  public:
    using Options = ManagerOptions;

    UpdateManager(AssemblyMetadata updatee,
                  std::shared_ptr<IPackageResolver> resolver,
                  std::shared_ptr<IPackageExtractor> extractor,
                  Options options = {});

    UpdateManager(AssemblyMetadata updatee,
                  std::shared_ptr<IPackageResolver> resolver,
                  std::shared_ptr<IPackageExtractor> extractor,
                  std::shared_ptr<const IUpdaterBinarySource> updater_source,
                  std::shared_ptr<const IProcessLauncher> launcher,
                  Options options = {});

    UpdateManager(const UpdateManager&) = delete;
    UpdateManager& operator=(const UpdateManager&) = delete;
    ~UpdateManager();

    const AssemblyMetadata& Updatee() const { return updatee_; }
    const StorageLayout& Storage() const { return layout_; }
    const Options& GetOptions() const { return options_; }

    std::expected<CheckForUpdatesResult, Result> CheckForUpdates(const CancelToken& cancel = {});
    // The future refers to this manager; it must be waited on before the
    // manager is destroyed.
    std::future<std::expected<CheckForUpdatesResult, Result>> CheckForUpdatesAsync(CancelToken cancel = {});

    // Archive consumed, content directory staged and helper materialized.
    bool IsUpdatePrepared(const Version& version) const;

    // Ascending.
    std::vector<Version> GetPreparedUpdates() const;

    // progress may be null; it must outlive the call (or the returned future).
    Result PrepareUpdate(const Version& version, IProgress* progress = nullptr, const CancelToken& cancel = {});
    // Like CheckForUpdatesAsync, the future must be waited on before the
    // manager is destroyed.
    std::future<Result> PrepareUpdateAsync(Version version, IProgress* progress = nullptr, CancelToken cancel = {});

    // Starts the helper and returns without waiting for it. The caller is
    // expected to exit promptly so the helper can replace its files.
    // additional_executables are resolved against the host's directory.
    Result LaunchUpdater(const Version& version,
                         bool restart = true,
                         const std::string& restart_arguments = {},
                         const std::vector<std::string>& additional_executables = {});

    // Releases the storage lock and closes the manager log. Idempotent. The
    // liveness lock on the updatee stays held until the process exits.
    void Dispose();

    // Command the helper would be started with; exposed for diagnostics.
    LaunchRequest BuildLaunchRequest(const Version& version,
                                     bool restart,
                                     const std::string& restart_arguments,
                                     const std::vector<std::string>& additional_executables) const;

  private:
    Result EnsureNotDisposed() const;
    Result EnsureLockFileAcquired();
    Result EnsureUpdaterNotLaunched() const;
    Result EnsureUpdatePrepared(const Version& version) const;

    Result PrepareUpdateCore(const Version& version, IProgress* progress, const CancelToken& cancel);
    Result LaunchUpdaterCore(const Version& version,
                             bool restart,
                             const std::string& restart_arguments,
                             const std::vector<std::string>& additional_executables);

    Result Failed(const char* operation, Result r);

    AssemblyMetadata updatee_;
    Options options_;
    StorageLayout layout_;

    std::shared_ptr<IPackageResolver> resolver_;
    std::shared_ptr<IPackageExtractor> extractor_;
    std::shared_ptr<const IUpdaterBinarySource> updater_source_;
    std::shared_ptr<const IProcessLauncher> launcher_;

    mutable std::mutex mu_;
    bool disposed_ = false;
    std::optional<LockFile> lock_file_;

    LogFile log_;
};

} // namespace onova
