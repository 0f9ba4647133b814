#include "onova/assembly_metadata.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace onova {

AssemblyMetadata::AssemblyMetadata(std::string executable_id, Version ver, std::string path,
                                   std::string storage_name)
    : name(storage_name.empty() ? executable_id : std::move(storage_name)),
      executable(std::move(executable_id)),
      version(ver),
      file_path(std::move(path)) {}

std::expected<AssemblyMetadata, Result> AssemblyMetadata::FromCurrentProcess(const Version& version,
                                                                             std::string name) {
    std::error_code ec;
    const fs::path self = fs::canonical("/proc/self/exe", ec);
    if (ec) {
        return std::unexpected(
            Result::Fail(UpdateErrc::Io, "cannot resolve /proc/self/exe: " + ec.message()));
    }
    return AssemblyMetadata(self.stem().string(), version, self.string(), std::move(name));
}

} // namespace onova
