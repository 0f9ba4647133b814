#include <gtest/gtest.h>

#include "io/file_access.hpp"
#include "onova/update_manager.hpp"
#include "testing.hpp"
#include "updater/updater_args.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>

namespace onova {
namespace {

namespace fs = std::filesystem;

class FakeResolver final : public IPackageResolver {
  public:
    std::vector<Version> versions;
    Result versions_result = Result::Ok();
    Result download_result = Result::Ok();
    int download_calls = 0;

    Result GetPackageVersions(const CancelToken& cancel, std::vector<Version>& out) override {
        if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "cancelled");
        if (!versions_result.is_ok()) return versions_result;
        out = versions;
        return Result::Ok();
    }

    Result DownloadPackage(const Version& version,
                           const std::string& destination_path,
                           IProgress* progress,
                           const CancelToken& cancel) override {
        ++download_calls;
        if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "cancelled");
        if (!download_result.is_ok()) return download_result;
        if (progress) progress->Report(0.5);
        if (!testutil::WriteTextFile(destination_path, "package " + version.ToString())) {
            return Result::Fail(UpdateErrc::Io, "write failed");
        }
        if (progress) progress->Report(1.0);
        return Result::Ok();
    }
};

class FakeExtractor final : public IPackageExtractor {
  public:
    std::map<std::string, std::string> files{{"MyApp", "new binary"}, {"data/config.json", "{}"}};
    Result result = Result::Ok();
    std::string seen_archive;

    Result ExtractPackage(const std::string& archive_path,
                          const std::string& destination_dir,
                          IProgress* progress,
                          const CancelToken&) override {
        seen_archive = testutil::ReadTextFile(archive_path);
        if (!result.is_ok()) return result;
        for (const auto& [rel, body] : files) {
            if (!testutil::WriteTextFile(destination_dir + "/" + rel, body)) {
                return Result::Fail(UpdateErrc::Io, "write failed");
            }
        }
        if (progress) progress->Report(1.0);
        return Result::Ok();
    }
};

class FakeBinarySource final : public IUpdaterBinarySource {
  public:
    mutable int writes = 0;

    Result WriteTo(const std::string& path) const override {
        ++writes;
        if (!testutil::WriteTextFile(path, "#!/bin/sh\n")) return Result::Fail(UpdateErrc::Io, "write failed");
        ::chmod(path.c_str(), 0755);
        return Result::Ok();
    }
};

class FakeLauncher final : public IProcessLauncher {
  public:
    mutable std::vector<LaunchRequest> requests;
    Result result = Result::Ok();

    Result LaunchDetached(const LaunchRequest& request, pid_t& out_pid) const override {
        requests.push_back(request);
        if (!result.is_ok()) return result;
        out_pid = 4242;
        return Result::Ok();
    }
};

class RecordingProgress final : public IProgress {
  public:
    void Report(double fraction) override {
        std::lock_guard<std::mutex> lk(mu);
        values.push_back(fraction);
    }
    std::mutex mu;
    std::vector<double> values;
};

class UpdateManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        app_dir = tmp.Sub("app");
        updatee_path = app_dir + "/MyApp";
        ASSERT_TRUE(testutil::WriteTextFile(updatee_path, "old binary"));

        resolver = std::make_shared<FakeResolver>();
        resolver->versions = {Version(1, 0), Version(1, 2)};
        extractor = std::make_shared<FakeExtractor>();
        source = std::make_shared<FakeBinarySource>();
        launcher = std::make_shared<FakeLauncher>();
        options.storage_root = tmp.Sub("storage");
    }

    std::unique_ptr<UpdateManager> MakeManager(Version current = Version(1, 0)) {
        return std::make_unique<UpdateManager>(AssemblyMetadata("MyApp", current, updatee_path),
                                               resolver, extractor, source, launcher, options);
    }

    std::string StorageDir() const { return options.storage_root + "/MyApp"; }

    testutil::TemporaryDirectory tmp;
    std::string app_dir;
    std::string updatee_path;
    std::shared_ptr<FakeResolver> resolver;
    std::shared_ptr<FakeExtractor> extractor;
    std::shared_ptr<FakeBinarySource> source;
    std::shared_ptr<FakeLauncher> launcher;
    UpdateManager::Options options;
};

TEST_F(UpdateManagerTest, CheckForUpdatesReportsNewerVersion) {
    auto manager = MakeManager();
    auto result = manager->CheckForUpdatesAsync().get();
    ASSERT_TRUE(result.has_value()) << result.error().msg;
    EXPECT_TRUE(result->can_update);
    ASSERT_TRUE(result->last_version.has_value());
    EXPECT_EQ(*result->last_version, Version(1, 2));
}

TEST_F(UpdateManagerTest, CheckForUpdatesWithNothingNewer) {
    resolver->versions = {};
    auto manager = MakeManager();
    auto result = manager->CheckForUpdates();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->can_update);
    EXPECT_FALSE(result->last_version.has_value());
}

TEST_F(UpdateManagerTest, ResolverErrorsSurfaceAsResolverFailure) {
    resolver->versions_result = Result::Fail(UpdateErrc::Io, "feed unreachable");
    auto manager = MakeManager();
    auto result = manager->CheckForUpdates();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(UpdateErrc::ResolverFailure));
    EXPECT_EQ(result.error().msg, "feed unreachable");

    const std::string log = testutil::ReadTextFile(StorageDir() + "/MyApp.UpdateManager.log");
    EXPECT_NE(log.find("CheckForUpdates - failed :: ResolverFailure - feed unreachable"), std::string::npos);
}

TEST_F(UpdateManagerTest, CancellationIsNotLoggedAsFailure) {
    auto manager = MakeManager();
    CancelSource cancel;
    cancel.Cancel();

    auto result = manager->CheckForUpdates(cancel.Token());
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(UpdateErrc::Cancelled));

    auto prepared = manager->PrepareUpdate(Version(1, 2), nullptr, cancel.Token());
    EXPECT_TRUE(prepared.Is(UpdateErrc::Cancelled));

    const std::string log = testutil::ReadTextFile(StorageDir() + "/MyApp.UpdateManager.log");
    EXPECT_NE(log.find("CheckForUpdates - cancelled"), std::string::npos);
    EXPECT_NE(log.find("PrepareUpdate - cancelled"), std::string::npos);
    EXPECT_EQ(log.find("- failed"), std::string::npos);
}

TEST_F(UpdateManagerTest, PrepareUpdateStagesContentAndHelper) {
    auto manager = MakeManager();
    RecordingProgress progress;

    auto r = manager->PrepareUpdateAsync(Version(1, 2), &progress).get();
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_TRUE(manager->IsUpdatePrepared(Version(1, 2)));
    EXPECT_FALSE(testutil::Exists(StorageDir() + "/1.2.0.0.onv"));
    EXPECT_EQ(testutil::ReadTextFile(StorageDir() + "/1.2.0.0/MyApp"), "new binary");
    EXPECT_EQ(testutil::ReadTextFile(StorageDir() + "/1.2.0.0/data/config.json"), "{}");
    EXPECT_TRUE(testutil::Exists(StorageDir() + "/MyApp.Updater"));
    EXPECT_TRUE(testutil::Exists(StorageDir() + "/MyApp.Updater.json"));
    EXPECT_EQ(extractor->seen_archive, "package 1.2.0.0");

    ASSERT_FALSE(progress.values.empty());
    EXPECT_NEAR(progress.values.front(), 0.45, 1e-9);
    EXPECT_NEAR(progress.values.back(), 1.0, 1e-9);
}

TEST_F(UpdateManagerTest, PrepareUpdateResetsStaleContent) {
    ASSERT_TRUE(testutil::WriteTextFile(StorageDir() + "/1.2.0.0/stale.txt", "stale"));
    auto manager = MakeManager();

    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());
    EXPECT_FALSE(testutil::Exists(StorageDir() + "/1.2.0.0/stale.txt"));
}

TEST_F(UpdateManagerTest, FailedExtractionIsNotPrepared) {
    extractor->result = Result::Fail(UpdateErrc::Io, "corrupt archive");
    auto manager = MakeManager();

    auto r = manager->PrepareUpdate(Version(1, 2));
    EXPECT_TRUE(r.Is(UpdateErrc::ExtractorFailure));
    EXPECT_FALSE(manager->IsUpdatePrepared(Version(1, 2)));

    const std::string log = testutil::ReadTextFile(StorageDir() + "/MyApp.UpdateManager.log");
    EXPECT_NE(log.find("PrepareUpdate - failed :: ExtractorFailure - corrupt archive"), std::string::npos);

    extractor->result = Result::Ok();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());
    EXPECT_TRUE(manager->IsUpdatePrepared(Version(1, 2)));
}

TEST_F(UpdateManagerTest, FailedDownloadIsResolverFailure) {
    resolver->download_result = Result::Fail(UpdateErrc::Io, "connection reset");
    auto manager = MakeManager();

    auto r = manager->PrepareUpdate(Version(1, 2));
    EXPECT_TRUE(r.Is(UpdateErrc::ResolverFailure));
    EXPECT_FALSE(manager->IsUpdatePrepared(Version(1, 2)));
}

TEST_F(UpdateManagerTest, PreparedUpdatesAreListedInOrder) {
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 1, 5)).is_ok());

    fs::create_directories(StorageDir() + "/not-a-version");
    fs::create_directories(StorageDir() + "/3.0.0.0");
    ASSERT_TRUE(testutil::WriteTextFile(StorageDir() + "/3.0.0.0.onv", "still downloading"));

    EXPECT_EQ(manager->GetPreparedUpdates(), (std::vector<Version>{Version(1, 1, 5), Version(1, 2)}));
}

TEST_F(UpdateManagerTest, PreparedUpdatesSkipNonCanonicalDirectoryNames) {
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());

    fs::create_directories(StorageDir() + "/1.2");
    fs::create_directories(StorageDir() + "/01.2.0.0");

    EXPECT_EQ(manager->GetPreparedUpdates(), (std::vector<Version>{Version(1, 2)}));
}

TEST_F(UpdateManagerTest, SecondInstanceCannotTakeTheLock) {
    auto first = MakeManager();
    auto second = MakeManager();

    ASSERT_TRUE(first->PrepareUpdate(Version(1, 2)).is_ok());
    EXPECT_TRUE(second->PrepareUpdate(Version(1, 2)).Is(UpdateErrc::LockNotAcquired));
    EXPECT_TRUE(second->LaunchUpdater(Version(1, 2)).Is(UpdateErrc::LockNotAcquired));

    first->Dispose();
    EXPECT_TRUE(second->PrepareUpdate(Version(1, 2)).is_ok());
}

TEST_F(UpdateManagerTest, OperationsAfterDisposeFail) {
    auto manager = MakeManager();
    manager->Dispose();
    manager->Dispose();

    EXPECT_TRUE(manager->CheckForUpdates().error().Is(UpdateErrc::Disposed));
    EXPECT_TRUE(manager->PrepareUpdate(Version(1, 2)).Is(UpdateErrc::Disposed));
    EXPECT_TRUE(manager->LaunchUpdater(Version(1, 2)).Is(UpdateErrc::Disposed));
    EXPECT_EQ(resolver->download_calls, 0);
    EXPECT_TRUE(launcher->requests.empty());
}

TEST_F(UpdateManagerTest, LaunchRequiresPreparedUpdate) {
    auto manager = MakeManager();
    auto r = manager->LaunchUpdater(Version(1, 2));
    EXPECT_TRUE(r.Is(UpdateErrc::UpdateNotPrepared));
    EXPECT_TRUE(launcher->requests.empty());
}

TEST_F(UpdateManagerTest, RunningUpdaterBlocksPrepareAndLaunch) {
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());

    auto running = LockFile::TryAcquireShared(StorageDir() + "/MyApp.Updater");
    ASSERT_TRUE(running.has_value());

    EXPECT_TRUE(manager->PrepareUpdate(Version(1, 2)).Is(UpdateErrc::UpdaterAlreadyLaunched));
    EXPECT_TRUE(manager->LaunchUpdater(Version(1, 2)).Is(UpdateErrc::UpdaterAlreadyLaunched));

    running.reset();
    EXPECT_TRUE(manager->LaunchUpdater(Version(1, 2)).is_ok());
}

TEST_F(UpdateManagerTest, LaunchEncodesHelperArguments) {
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());

    const std::string routed = R"(--open "my file.txt" --mode 'a b')";
    auto r = manager->LaunchUpdater(Version(1, 2), true, routed, {"MyAppWorker", "/abs/tool"});
    ASSERT_TRUE(r.is_ok()) << r.msg;

    ASSERT_EQ(launcher->requests.size(), 1u);
    const LaunchRequest& req = launcher->requests.front();
    EXPECT_EQ(req.program, StorageDir() + "/MyApp.Updater");
    EXPECT_EQ(req.working_dir, StorageDir());

    auto args = UpdaterArgs::Decode(req.args);
    ASSERT_TRUE(args.has_value()) << args.error();
    EXPECT_EQ(args->updatee_file_path, updatee_path);
    EXPECT_EQ(args->package_content_dir_path, StorageDir() + "/1.2.0.0");
    EXPECT_TRUE(args->restart);
    EXPECT_EQ(args->routed_args, routed);
    EXPECT_EQ(args->additional_executables,
              (std::vector<std::string>{app_dir + "/MyAppWorker", "/abs/tool"}));

    const std::string log = testutil::ReadTextFile(StorageDir() + "/MyApp.UpdateManager.log");
    EXPECT_NE(log.find("pid 4242"), std::string::npos);
}

TEST_F(UpdateManagerTest, ReadOnlyInstallDirectoryRequestsElevation) {
    if (::geteuid() == 0) GTEST_SKIP() << "root can write to read-only directories";

    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());
    ASSERT_EQ(::chmod(app_dir.c_str(), 0555), 0);

    auto r = manager->LaunchUpdater(Version(1, 2), false);
    ::chmod(app_dir.c_str(), 0755);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    ASSERT_EQ(launcher->requests.size(), 1u);
    const LaunchRequest& req = launcher->requests.front();
    EXPECT_EQ(req.program, "pkexec");
    ASSERT_EQ(req.args.size(), static_cast<size_t>(kUpdaterArgCount) + 1);
    EXPECT_EQ(req.args.front(), StorageDir() + "/MyApp.Updater");
}

TEST_F(UpdateManagerTest, LauncherFailureIsReported) {
    launcher->result = Result::Fail(UpdateErrc::Io, "exec failed");
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());

    auto r = manager->LaunchUpdater(Version(1, 2));
    EXPECT_TRUE(r.Is(UpdateErrc::LaunchFailed));
}

TEST_F(UpdateManagerTest, LivenessLockOutlivesManager) {
    auto manager = MakeManager();
    EXPECT_FALSE(CheckWriteAccess(updatee_path));

    manager->Dispose();
    EXPECT_FALSE(CheckWriteAccess(updatee_path));

    manager.reset();
    EXPECT_FALSE(CheckWriteAccess(updatee_path));

    // A later manager for the same updatee in this process reuses the lock.
    auto again = MakeManager();
    EXPECT_FALSE(CheckWriteAccess(updatee_path));
}

TEST_F(UpdateManagerTest, HelperConfigCarriesUpdaterOptions) {
    options.updater.wait_timeout = std::chrono::milliseconds(2500);
    options.updater.runtime_host = "mono";
    auto manager = MakeManager();
    ASSERT_TRUE(manager->PrepareUpdate(Version(1, 2)).is_ok());

    UpdaterOptions read;
    LogLevel level = LogLevel::None;
    ASSERT_TRUE(LoadUpdaterConfigFromFile(StorageDir() + "/MyApp.Updater.json", read, level).is_ok());
    EXPECT_EQ(read.wait_timeout.count(), 2500);
    EXPECT_EQ(read.runtime_host, "mono");
    EXPECT_EQ(level, LogLevel::Info);
}

} // namespace
} // namespace onova
