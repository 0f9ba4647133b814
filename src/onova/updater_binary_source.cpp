#include "onova/updater_binary_source.hpp"

#include "io/atomic_file_writer.hpp"
#include "io/file_reader.hpp"

namespace onova {

FileUpdaterBinarySource::FileUpdaterBinarySource(std::string source_path)
    : source_path_(std::move(source_path)) {}

Result FileUpdaterBinarySource::WriteTo(const std::string& path) const {
    FileReader reader;
    if (auto r = FileReader::Open(source_path_, reader); !r.is_ok()) {
        return Result::Fail(UpdateErrc::Io, "updater binary source: " + r.message());
    }

    AtomicFileWriter writer;
    if (auto r = AtomicFileWriter::Open(path, 0755, writer); !r.is_ok()) return r;
    if (auto r = CopyStream(reader, writer); !r.is_ok()) return r;
    return writer.Commit();
}

} // namespace onova
