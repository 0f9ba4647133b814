#include "system/process_launcher.hpp"

#include "util/command_line.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace onova {

namespace {

ssize_t ReadFull(int fd, void* buf, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::read(fd, static_cast<char*>(buf) + off, len - off);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        off += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(off);
}

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] void ExecGrandchild(const char* path, char* const* argv, const char* cwd, int report_fd) {
    if (cwd && *cwd && ::chdir(cwd) != 0) {
        const int err = errno;
        (void)!::write(report_fd, &err, sizeof(err));
        ::_exit(127);
    }

    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
    }

    ::execv(path, argv);
    const int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
}

class PosixProcessLauncher final : public IProcessLauncher {
  public:
    Result LaunchDetached(const LaunchRequest& request, pid_t& out_pid) const override {
        if (request.program.empty()) {
            return Result::Fail(UpdateErrc::InvalidArgument, "launch: empty program");
        }

        const std::string path = ResolveProgramPath(request.program);
        std::vector<std::string> argv_storage = request.Argv();
        std::vector<char*> argv;
        argv.reserve(argv_storage.size() + 1);
        for (auto& a : argv_storage) argv.push_back(a.data());
        argv.push_back(nullptr);

        // The middle child reports the grandchild's pid on one pipe; the
        // grandchild reports a failed chdir or exec on the other. A successful
        // exec closes the error pipe through O_CLOEXEC.
        int pid_pipe[2];
        if (::pipe2(pid_pipe, O_CLOEXEC) != 0) {
            return Result::Fail(UpdateErrc::LaunchFailed,
                                std::string("pipe2 failed: ") + std::strerror(errno));
        }
        int err_pipe[2];
        if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
            const int err = errno;
            ::close(pid_pipe[0]);
            ::close(pid_pipe[1]);
            return Result::Fail(UpdateErrc::LaunchFailed, std::string("pipe2 failed: ") + std::strerror(err));
        }

        const pid_t middle = ::fork();
        if (middle < 0) {
            const int err = errno;
            for (int fd : {pid_pipe[0], pid_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
            return Result::Fail(UpdateErrc::LaunchFailed, std::string("fork failed: ") + std::strerror(err));
        }

        if (middle == 0) {
            ::close(pid_pipe[0]);
            ::close(err_pipe[0]);
            ::setsid();
            const pid_t child = ::fork();
            if (child == 0) {
                ::close(pid_pipe[1]);
                ExecGrandchild(path.c_str(), argv.data(), request.working_dir.c_str(), err_pipe[1]);
            }
            (void)!::write(pid_pipe[1], &child, sizeof(child));
            ::_exit(child < 0 ? 1 : 0);
        }

        ::close(pid_pipe[1]);
        ::close(err_pipe[1]);
        int status = 0;
        while (::waitpid(middle, &status, 0) < 0 && errno == EINTR) {
        }

        pid_t child = -1;
        const ssize_t got_pid = ReadFull(pid_pipe[0], &child, sizeof(child));
        ::close(pid_pipe[0]);
        if (got_pid != static_cast<ssize_t>(sizeof(child)) || child <= 0) {
            ::close(err_pipe[0]);
            return Result::Fail(UpdateErrc::LaunchFailed, "fork failed in launcher child");
        }

        int exec_errno = 0;
        const ssize_t got_err = ReadFull(err_pipe[0], &exec_errno, sizeof(exec_errno));
        ::close(err_pipe[0]);
        if (got_err == static_cast<ssize_t>(sizeof(exec_errno))) {
            return Result::Fail(UpdateErrc::LaunchFailed,
                                "exec " + path + " failed: " + std::strerror(exec_errno));
        }

        LogDebug("launched pid=%d: %s", static_cast<int>(child),
                 JoinCommandLine(argv_storage).c_str());
        out_pid = child;
        return Result::Ok();
    }
};

} // namespace

std::vector<std::string> LaunchRequest::Argv() const {
    std::vector<std::string> out;
    out.reserve(args.size() + 1);
    out.push_back(program);
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::shared_ptr<const IProcessLauncher> DefaultProcessLauncher() {
    static const std::shared_ptr<const IProcessLauncher> kDefault =
        std::make_shared<PosixProcessLauncher>();
    return kDefault;
}

std::string ResolveProgramPath(const std::string& program) {
    if (program.find('/') != std::string::npos) return program;

    const char* path_env = std::getenv("PATH");
    const std::string search = (path_env && *path_env) ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= search.size()) {
        const size_t pos = search.find(':', start);
        const std::string dir = search.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        const fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate.string();
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return program;
}

} // namespace onova
