#include "onova/update_manager.hpp"

#include "io/file_access.hpp"
#include "onova/progress_mixer.hpp"
#include "updater/updater_args.hpp"
#include "util/command_line.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace onova {

namespace {

std::string DefaultUpdaterSourcePath(const ManagerOptions& options, const AssemblyMetadata& updatee) {
    if (!options.updater_source_path.empty()) return options.updater_source_path;
    return (fs::path(updatee.file_path).parent_path() / kUpdaterExecutableName).string();
}

std::string StorageRootOf(const ManagerOptions& options) {
    return options.storage_root.empty() ? StorageLayout::DefaultRoot() : options.storage_root;
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

// Reported codes from the pluggable strategies are folded into one failure
// kind per strategy; cancellation passes through unchanged.
Result AsStrategyFailure(Result r, UpdateErrc kind) {
    if (r.is_ok() || r.Is(UpdateErrc::Cancelled)) return r;
    r.err = static_cast<int>(kind);
    return r;
}

} // namespace

UpdateManager::UpdateManager(AssemblyMetadata updatee,
                             std::shared_ptr<IPackageResolver> resolver,
                             std::shared_ptr<IPackageExtractor> extractor,
                             Options options)
    : UpdateManager(updatee,
                    std::move(resolver),
                    std::move(extractor),
                    std::make_shared<FileUpdaterBinarySource>(DefaultUpdaterSourcePath(options, updatee)),
                    DefaultProcessLauncher(),
                    options) {}

UpdateManager::UpdateManager(AssemblyMetadata updatee,
                             std::shared_ptr<IPackageResolver> resolver,
                             std::shared_ptr<IPackageExtractor> extractor,
                             std::shared_ptr<const IUpdaterBinarySource> updater_source,
                             std::shared_ptr<const IProcessLauncher> launcher,
                             Options options)
    : updatee_(std::move(updatee)),
      options_(std::move(options)),
      layout_(StorageRootOf(options_), updatee_.name, options_.package_extension),
      resolver_(std::move(resolver)),
      extractor_(std::move(extractor)),
      updater_source_(std::move(updater_source)),
      launcher_(std::move(launcher)) {
    log_.SetLevel(options_.log_level);

    if (auto r = layout_.EnsureStorageDir(); !r.is_ok()) {
        LogWarn("UpdateManager: %s", r.message().c_str());
    } else if (auto lr = log_.Open(layout_.ManagerLogPath()); !lr.is_ok()) {
        LogWarn("UpdateManager: %s", lr.message().c_str());
    }

    // Lets a helper started by any instance see that this process still runs,
    // also after this manager is gone.
    if (!LockFile::HoldSharedUntilExit(updatee_.file_path)) {
        log_.Write(LogLevel::Warn, "UpdateManager - liveness lock not taken on %s", updatee_.file_path.c_str());
    }

    log_.Write(LogLevel::Info, "UpdateManager initialized for %s %s (%s)",
               updatee_.name.c_str(), updatee_.version.ToString().c_str(), layout_.StorageDir().c_str());
}

UpdateManager::~UpdateManager() { Dispose(); }

void UpdateManager::Dispose() {
    std::lock_guard<std::mutex> lk(mu_);
    if (disposed_) return;
    disposed_ = true;

    lock_file_.reset();

    log_.Write(LogLevel::Info, "UpdateManager disposed");
    log_.Close();
}

Result UpdateManager::Failed(const char* operation, Result r) {
    if (r.Is(UpdateErrc::Cancelled)) {
        log_.Write(LogLevel::Info, "%s - cancelled", operation);
    } else {
        log_.Write(LogLevel::Error, "%s - failed :: %s - %s", operation, ToString(r.code()), r.message().c_str());
    }
    return r;
}

Result UpdateManager::EnsureNotDisposed() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (disposed_) {
        return Result::Fail(UpdateErrc::Disposed, "UpdateManager for " + updatee_.name + " is disposed");
    }
    return Result::Ok();
}

Result UpdateManager::EnsureLockFileAcquired() {
    if (auto r = layout_.EnsureStorageDir(); !r.is_ok()) return r;

    std::lock_guard<std::mutex> lk(mu_);
    if (!lock_file_) {
        lock_file_ = LockFile::TryAcquire(layout_.LockFilePath());
    }
    if (!lock_file_) {
        return Result::Fail(UpdateErrc::LockNotAcquired,
                            "lock file " + layout_.LockFilePath() + " is held by another instance");
    }
    return Result::Ok();
}

Result UpdateManager::EnsureUpdaterNotLaunched() const {
    const std::string updater = layout_.UpdaterFilePath();
    if (FileExists(updater) && !CheckWriteAccess(updater)) {
        return Result::Fail(UpdateErrc::UpdaterAlreadyLaunched, "updater is already running: " + updater);
    }
    return Result::Ok();
}

Result UpdateManager::EnsureUpdatePrepared(const Version& version) const {
    if (!IsUpdatePrepared(version)) {
        return Result::Fail(UpdateErrc::UpdateNotPrepared, "update " + version.ToString() + " is not prepared");
    }
    return Result::Ok();
}

std::expected<CheckForUpdatesResult, Result> UpdateManager::CheckForUpdates(const CancelToken& cancel) {
    static constexpr const char kOp[] = "CheckForUpdates";
    log_.Write(LogLevel::Debug, "%s - started", kOp);

    if (auto r = EnsureNotDisposed(); !r.is_ok()) return std::unexpected(Failed(kOp, r));

    std::vector<Version> versions;
    Result rr;
    try {
        rr = resolver_->GetPackageVersions(cancel, versions);
    } catch (const std::exception& e) {
        rr = Result::Fail(UpdateErrc::ResolverFailure, e.what());
    }
    if (!rr.is_ok()) return std::unexpected(Failed(kOp, AsStrategyFailure(rr, UpdateErrc::ResolverFailure)));

    auto result = CheckForUpdatesResult::From(std::move(versions), updatee_.version);
    log_.Write(LogLevel::Info, "%s - finished: %zu versions, last %s, can update: %s", kOp,
               result.versions.size(),
               result.last_version ? result.last_version->ToString().c_str() : "none",
               result.can_update ? "yes" : "no");
    return result;
}

std::future<std::expected<CheckForUpdatesResult, Result>> UpdateManager::CheckForUpdatesAsync(CancelToken cancel) {
    return std::async(std::launch::async, [this, cancel] { return CheckForUpdates(cancel); });
}

bool UpdateManager::IsUpdatePrepared(const Version& version) const {
    std::error_code ec;
    const bool archive_gone = !fs::exists(layout_.PackageFilePath(version), ec);
    const bool content_dir = fs::is_directory(layout_.PackageContentDirPath(version), ec);
    const bool updater = fs::is_regular_file(layout_.UpdaterFilePath(), ec);
    return archive_gone && content_dir && updater;
}

std::vector<Version> UpdateManager::GetPreparedUpdates() const {
    std::vector<Version> out;

    std::error_code ec;
    for (fs::directory_iterator it(layout_.StorageDir(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;

        // "1.2" parses as 1.2.0.0; only the canonical name is a staged directory.
        const std::string name = it->path().filename().string();
        auto version = Version::TryParse(name);
        if (version && version->ToString() == name && IsUpdatePrepared(*version)) out.push_back(*version);
    }

    std::sort(out.begin(), out.end());
    return out;
}

Result UpdateManager::PrepareUpdate(const Version& version, IProgress* progress, const CancelToken& cancel) {
    static constexpr const char kOp[] = "PrepareUpdate";
    log_.Write(LogLevel::Info, "%s - started (%s)", kOp, version.ToString().c_str());

    auto r = PrepareUpdateCore(version, progress, cancel);
    if (!r.is_ok()) return Failed(kOp, r);

    log_.Write(LogLevel::Info, "%s - finished (%s)", kOp, version.ToString().c_str());
    return r;
}

std::future<Result> UpdateManager::PrepareUpdateAsync(Version version, IProgress* progress, CancelToken cancel) {
    return std::async(std::launch::async,
                      [this, version, progress, cancel] { return PrepareUpdate(version, progress, cancel); });
}

Result UpdateManager::PrepareUpdateCore(const Version& version, IProgress* progress, const CancelToken& cancel) {
    if (auto r = EnsureNotDisposed(); !r.is_ok()) return r;
    if (auto r = EnsureLockFileAcquired(); !r.is_ok()) return r;
    if (auto r = EnsureUpdaterNotLaunched(); !r.is_ok()) return r;

    std::optional<ProgressMixer> mixer;
    if (progress) mixer.emplace(progress);

    const std::string package_file = layout_.PackageFilePath(version);
    const std::string content_dir = layout_.PackageContentDirPath(version);

    if (auto r = layout_.EnsureStorageDir(); !r.is_ok()) return r;

    Result dr;
    try {
        dr = resolver_->DownloadPackage(version, package_file, mixer ? mixer->Split(0.9) : nullptr, cancel);
    } catch (const std::exception& e) {
        dr = Result::Fail(UpdateErrc::ResolverFailure, e.what());
    }
    if (!dr.is_ok()) return AsStrategyFailure(dr, UpdateErrc::ResolverFailure);
    log_.Write(LogLevel::Debug, "%s - downloaded %s", "PrepareUpdate", package_file.c_str());

    if (auto r = ResetDirectory(content_dir); !r.is_ok()) return r;

    Result er;
    try {
        er = extractor_->ExtractPackage(package_file, content_dir, mixer ? mixer->Split(0.1) : nullptr, cancel);
    } catch (const std::exception& e) {
        er = Result::Fail(UpdateErrc::ExtractorFailure, e.what());
    }
    if (!er.is_ok()) return AsStrategyFailure(er, UpdateErrc::ExtractorFailure);

    std::error_code ec;
    fs::remove(package_file, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::Io, "cannot delete package " + package_file + ": " + ec.message());
    }

    if (auto r = updater_source_->WriteTo(layout_.UpdaterFilePath()); !r.is_ok()) return r;
    return SaveUpdaterConfig(layout_.UpdaterConfigPath(), options_.updater, options_.log_level);
}

LaunchRequest UpdateManager::BuildLaunchRequest(const Version& version,
                                                bool restart,
                                                const std::string& restart_arguments,
                                                const std::vector<std::string>& additional_executables) const {
    const fs::path updatee_dir = fs::path(updatee_.file_path).parent_path();

    UpdaterArgs args;
    args.updatee_file_path = updatee_.file_path;
    args.package_content_dir_path = layout_.PackageContentDirPath(version);
    args.restart = restart;
    args.routed_args = restart_arguments;
    for (const auto& exe : additional_executables) {
        args.additional_executables.push_back((updatee_dir / exe).lexically_normal().string());
    }

    LaunchRequest request;
    request.program = layout_.UpdaterFilePath();
    request.args = args.Encode();
    request.working_dir = layout_.StorageDir();

    const bool needs_elevation = !updatee_dir.empty() && !CheckDirectoryWriteAccess(updatee_dir.string());
    if (needs_elevation && !options_.updater.elevation_command.empty()) {
        request.args.insert(request.args.begin(), request.program);
        request.program = options_.updater.elevation_command;
    }
    return request;
}

Result UpdateManager::LaunchUpdater(const Version& version,
                                    bool restart,
                                    const std::string& restart_arguments,
                                    const std::vector<std::string>& additional_executables) {
    static constexpr const char kOp[] = "LaunchUpdater";
    log_.Write(LogLevel::Info, "%s - started (%s)", kOp, version.ToString().c_str());

    auto r = LaunchUpdaterCore(version, restart, restart_arguments, additional_executables);
    if (!r.is_ok()) return Failed(kOp, r);

    log_.Write(LogLevel::Info, "%s - finished", kOp);
    return r;
}

Result UpdateManager::LaunchUpdaterCore(const Version& version,
                                        bool restart,
                                        const std::string& restart_arguments,
                                        const std::vector<std::string>& additional_executables) {
    if (auto r = EnsureNotDisposed(); !r.is_ok()) return r;
    if (auto r = EnsureLockFileAcquired(); !r.is_ok()) return r;
    if (auto r = EnsureUpdaterNotLaunched(); !r.is_ok()) return r;
    if (auto r = EnsureUpdatePrepared(version); !r.is_ok()) return r;

    const LaunchRequest request = BuildLaunchRequest(version, restart, restart_arguments, additional_executables);
    if (request.program != layout_.UpdaterFilePath()) {
        log_.Write(LogLevel::Info, "LaunchUpdater - %s is not writable, elevating with %s",
                   fs::path(updatee_.file_path).parent_path().c_str(), request.program.c_str());
    }
    log_.Write(LogLevel::Info, "LaunchUpdater - starting: %s", JoinCommandLine(request.Argv()).c_str());

    pid_t pid = -1;
    if (auto r = launcher_->LaunchDetached(request, pid); !r.is_ok()) {
        if (r.code() != UpdateErrc::LaunchFailed) r.err = static_cast<int>(UpdateErrc::LaunchFailed);
        return r;
    }
    log_.Write(LogLevel::Info, "LaunchUpdater - updater started (pid %d)", static_cast<int>(pid));
    return Result::Ok();
}

} // namespace onova
