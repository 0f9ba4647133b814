#include "io/atomic_file_writer.hpp"

#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace onova {

namespace {

Result ErrnoFail(const std::string& what, int err) {
    return Result::Fail(UpdateErrc::Io, what + " (" + std::strerror(err) + ")");
}

} // namespace

AtomicFileWriter::~AtomicFileWriter() { Abort(); }

Result AtomicFileWriter::Open(std::string target_path, mode_t mode, AtomicFileWriter& out,
                              std::string_view tmp_suffix) {
    out.Abort();
    out.target_path_ = std::move(target_path);
    out.tmp_path_ = out.target_path_ + std::string(tmp_suffix);
    out.mode_ = mode;

    const int fd = ::open(out.tmp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        const int err = errno;
        out.tmp_path_.clear();
        return ErrnoFail("Failed to open output: " + out.target_path_, err);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result AtomicFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return ErrnoFail("Write failed: " + tmp_path_, errno);
    }

    return Result::Ok();
}

Result AtomicFileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return ErrnoFail("fsync failed: " + tmp_path_, errno);
    }
    return Result::Ok();
}

Result AtomicFileWriter::Commit() {
    if (!fd_.Valid()) return Result::Fail(UpdateErrc::Io, "writer not open: " + target_path_);

    auto fr = FsyncNow();
    if (!fr.is_ok()) return fr;

    // The umask may have narrowed the mode passed to open().
    if (::fchmod(fd_.Get(), mode_) != 0) {
        return ErrnoFail("chmod failed: " + tmp_path_, errno);
    }
    fd_.Close();

    if (::rename(tmp_path_.c_str(), target_path_.c_str()) != 0) {
        const int err = errno;
        Abort();
        return ErrnoFail("Atomic rename failed: " + target_path_, err);
    }
    tmp_path_.clear();
    return Result::Ok();
}

void AtomicFileWriter::Abort() {
    fd_.Close();
    if (!tmp_path_.empty()) {
        ::unlink(tmp_path_.c_str());
        tmp_path_.clear();
    }
}

Result CopyStream(IReader& reader, IWriter& writer, const ChunkCallback& on_chunk) {
    std::vector<std::uint8_t> buffer(256 * 1024);
    std::uint64_t copied = 0;

    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(UpdateErrc::Io, "Read failed during copy");

        auto wr = writer.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!wr.is_ok()) return wr;

        copied += static_cast<std::uint64_t>(n);
        if (on_chunk) {
            auto cr = on_chunk(copied);
            if (!cr.is_ok()) return cr;
        }
    }
    return Result::Ok();
}

Result CopyFileAtomic(const std::string& source, const std::string& target) {
    FileReader reader;
    auto orr = FileReader::Open(source, reader);
    if (!orr.is_ok()) return orr;

    struct stat st{};
    mode_t mode = 0644;
    if (::stat(source.c_str(), &st) == 0) {
        mode = st.st_mode & 07777;
    }

    AtomicFileWriter writer;
    auto owr = AtomicFileWriter::Open(target, mode, writer);
    if (!owr.is_ok()) return owr;

    auto cr = CopyStream(reader, writer);
    if (!cr.is_ok()) return cr;

    return writer.Commit();
}

} // namespace onova
