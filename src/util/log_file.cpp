#include "util/log_file.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace onova {

namespace {

std::string FormatTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    if (localtime_r(&secs, &tm) == nullptr) return {};

    char date[32]{};
    std::strftime(date, sizeof(date), "%d-%b-%Y %H:%M:%S", &tm);

    char out[40]{};
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(millis));
    return out;
}

std::string VFormat(const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return {};

    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, ap);
    return std::string(buf.data(), static_cast<size_t>(n));
}

} // namespace

Result LogFile::Open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result::Fail(UpdateErrc::Io,
                            "cannot open log " + path + " (" + std::strerror(errno) + ")");
    }
    fd_.Reset(fd);
    path_ = path;
    return Result::Ok();
}

void LogFile::Close() {
    std::lock_guard<std::mutex> lk(mu_);
    fd_.Close();
}

bool LogFile::IsOpen() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_.Valid();
}

void LogFile::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

std::string LogFile::FormatLine(const std::string& message) {
    return FormatTimestamp() + "> " + message + "\n";
}

void LogFile::Write(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VWrite(lvl, fmt, ap);
    va_end(ap);
}

void LogFile::VWrite(LogLevel lvl, const char* fmt, va_list ap) {
    const std::string message = VFormat(fmt, ap);
    Logger::Instance().Log(lvl, "%s", message.c_str());

    std::lock_guard<std::mutex> lk(mu_);
    if (!fd_.Valid() || lvl < level_ || lvl == LogLevel::None) return;

    const std::string line = FormatLine(message);
    size_t off = 0;
    while (off < line.size()) {
        const ssize_t n = ::write(fd_.Get(), line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        off += static_cast<size_t>(n);
    }
}

} // namespace onova
