#pragma once

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdarg>
#include <mutex>
#include <string>

namespace onova {

// Append-only component log. Every line is "dd-MMM-yyyy HH:mm:ss.fff> message",
// written with a single write(2) so concurrent appenders never interleave.
// Lines are mirrored to the process-wide Logger at the given level.
class LogFile {
public:
    LogFile() = default;
    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    Result Open(const std::string& path);
    void Close();
    bool IsOpen() const;
    const std::string& Path() const { return path_; }

    // Lines below lvl are mirrored to the Logger but not written to the file.
    void SetLevel(LogLevel lvl);

    void Write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VWrite(LogLevel lvl, const char* fmt, va_list ap);

    static std::string FormatLine(const std::string& message);

private:
    mutable std::mutex mu_;
    std::string path_;
    LogLevel level_ = LogLevel::Debug;
    Fd fd_;
};

} // namespace onova
