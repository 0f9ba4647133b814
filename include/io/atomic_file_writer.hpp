#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace onova {

// Writes into "<target><tmp_suffix>" and renames over the target on Commit().
// An uncommitted writer unlinks its temporary file on destruction, so a failed
// write never leaves a partial file at the target path.
class AtomicFileWriter final : public IWriter {
  public:
    AtomicFileWriter() = default;
    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    ~AtomicFileWriter() override;

    static Result Open(std::string target_path, mode_t mode, AtomicFileWriter& out,
                       std::string_view tmp_suffix = ".onova-tmp");

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    Result Commit();
    void Abort();

    const std::string& TempPath() const { return tmp_path_; }

  private:
    std::string target_path_;
    std::string tmp_path_;
    mode_t mode_ = 0644;
    Fd fd_;
};

// Pumps reader into writer; on_chunk receives the running byte count and may
// return a failed Result to stop the copy.
using ChunkCallback = std::function<Result(std::uint64_t copied)>;
Result CopyStream(IReader& reader, IWriter& writer, const ChunkCallback& on_chunk = {});

// Atomic single-file copy preserving mode bits of the source.
Result CopyFileAtomic(const std::string& source, const std::string& target);

} // namespace onova
