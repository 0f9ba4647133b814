#include "updater/updater.hpp"

#include "io/atomic_file_writer.hpp"
#include "io/file_access.hpp"
#include "onova/storage_layout.hpp"
#include "util/command_line.hpp"

#include <filesystem>
#include <unistd.h>
#include <utility>

#ifndef ONOVA_VERSION
#define ONOVA_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace onova {

namespace {

bool IsExecutableFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

Result CopySymlink(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    const fs::path link_target = fs::read_symlink(source, ec);
    if (ec) return Result::Fail(UpdateErrc::Io, "readlink " + source.string() + ": " + ec.message());

    const fs::path tmp = target.string() + ".onova-tmp";
    fs::remove(tmp, ec);
    fs::create_symlink(link_target, tmp, ec);
    if (ec) return Result::Fail(UpdateErrc::Io, "symlink " + tmp.string() + ": " + ec.message());

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result::Fail(UpdateErrc::Io, "rename " + target.string() + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace

std::expected<LaunchRequest, Result> ResolveRestartCommand(const std::string& updatee_file_path,
                                                           const std::string& routed_args,
                                                           const UpdaterOptions& options) {
    auto args = SplitCommandLine(routed_args);
    if (!args) {
        return std::unexpected(
            Result::Fail(UpdateErrc::InvalidArgument, "cannot split restart arguments: " + args.error()));
    }

    const fs::path updatee(updatee_file_path);

    LaunchRequest request;
    request.working_dir = updatee.parent_path().string();

    if (updatee.extension() == kExecutableSuffix) {
        request.program = updatee.string();
        request.args = std::move(*args);
        return request;
    }

    fs::path sibling = updatee;
    sibling.replace_extension(kExecutableSuffix);
    if (options.allow_sibling_executable && sibling != updatee && IsExecutableFile(sibling)) {
        request.program = sibling.string();
        request.args = std::move(*args);
        return request;
    }

    if (options.runtime_host.empty()) {
        return std::unexpected(Result::Fail(UpdateErrc::InvalidArgument,
                                            "no runtime host configured to start " + updatee.string()));
    }
    request.program = options.runtime_host;
    request.args.push_back(updatee.string());
    request.args.insert(request.args.end(), args->begin(), args->end());
    return request;
}

Result CopyDirectoryContents(const std::string& source_dir, const std::string& dest_dir) {
    std::error_code ec;
    const fs::path src(source_dir);
    const fs::path dst(dest_dir);

    if (!fs::is_directory(src, ec)) {
        return Result::Fail(UpdateErrc::Io, "not a directory: " + source_dir);
    }
    fs::create_directories(dst, ec);
    if (ec) return Result::Fail(UpdateErrc::Io, "create_directories " + dest_dir + ": " + ec.message());

    fs::recursive_directory_iterator it(src, ec), end;
    if (ec) return Result::Fail(UpdateErrc::Io, "cannot list " + source_dir + ": " + ec.message());

    for (; it != end; it.increment(ec)) {
        if (ec) return Result::Fail(UpdateErrc::Io, "cannot list " + source_dir + ": " + ec.message());

        const fs::path rel = it->path().lexically_relative(src);
        const fs::path target = dst / rel;
        const auto status = it->symlink_status(ec);
        if (ec) return Result::Fail(UpdateErrc::Io, "stat " + it->path().string() + ": " + ec.message());

        if (fs::is_symlink(status)) {
            if (auto r = CopySymlink(it->path(), target); !r.is_ok()) return r;
        } else if (fs::is_directory(status)) {
            fs::create_directories(target, ec);
            if (ec) return Result::Fail(UpdateErrc::Io, "create_directories " + target.string() + ": " + ec.message());
        } else if (fs::is_regular_file(status)) {
            if (auto r = CopyFileAtomic(it->path().string(), target.string()); !r.is_ok()) return r;
        }
    }
    return Result::Ok();
}

Updater::Updater(UpdaterArgs args, UpdaterOptions options, std::shared_ptr<const IProcessLauncher> launcher)
    : args_(std::move(args)), options_(std::move(options)), launcher_(std::move(launcher)) {}

Result Updater::OpenLog(const std::string& path, LogLevel level) {
    log_.SetLevel(level);
    return log_.Open(path);
}

void Updater::Run() {
    std::string executables;
    for (const auto& exe : args_.additional_executables) {
        if (!executables.empty()) executables += ";";
        executables += exe;
    }

    log_.Write(LogLevel::Info,
               "Onova Updater v%s started with the following arguments: "
               "UpdateeFilePath = %s, PackageContentDirPath = %s, RestartUpdatee = %s, "
               "RoutedArgs = %s, AdditionalExecutables = %s",
               ONOVA_VERSION,
               args_.updatee_file_path.c_str(),
               args_.package_content_dir_path.c_str(),
               args_.restart ? "True" : "False",
               args_.routed_args.c_str(),
               executables.c_str());

    Result r;
    try {
        r = RunCore();
    } catch (const std::exception& e) {
        r = Result::Fail(UpdateErrc::Io, e.what());
    }

    if (!r.is_ok()) {
        log_.Write(LogLevel::Error, "Update failed :: %s - %s", ToString(r.code()), r.message().c_str());
        return;
    }
    log_.Write(LogLevel::Info, "Update finished");
}

Result Updater::AwaitWritable() {
    std::vector<std::string> files{args_.updatee_file_path};
    for (const auto& exe : args_.additional_executables) {
        std::error_code ec;
        if (fs::exists(exe, ec)) files.push_back(exe);
    }

    log_.Write(LogLevel::Info, "Waiting for all running updatee instances to exit (%zu files)...", files.size());
    const WaitOptions wait{.poll_interval = options_.poll_interval, .timeout = options_.wait_timeout};
    return WaitForWriteAccessAll(files, wait);
}

Result Updater::Restart() {
    auto request = ResolveRestartCommand(args_.updatee_file_path, args_.routed_args, options_);
    if (!request) return request.error();

    log_.Write(LogLevel::Info, "Restarting updatee [%s]...", JoinCommandLine(request->Argv()).c_str());

    pid_t pid = -1;
    if (auto r = launcher_->LaunchDetached(*request, pid); !r.is_ok()) return r;
    log_.Write(LogLevel::Info, "Restarted as pid:%d.", static_cast<int>(pid));
    return Result::Ok();
}

Result Updater::RunCore() {
    const std::string updatee_dir = fs::path(args_.updatee_file_path).parent_path().string();

    if (auto r = AwaitWritable(); !r.is_ok()) return r;

    log_.Write(LogLevel::Info, "Copying package contents from storage to updatee's directory...");
    if (auto r = CopyDirectoryContents(args_.package_content_dir_path, updatee_dir); !r.is_ok()) return r;

    if (args_.restart) {
        if (auto r = Restart(); !r.is_ok()) return r;
    }

    log_.Write(LogLevel::Info, "Deleting package contents from storage...");
    std::error_code ec;
    fs::remove_all(args_.package_content_dir_path, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::Io,
                            "cannot delete " + args_.package_content_dir_path + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace onova
