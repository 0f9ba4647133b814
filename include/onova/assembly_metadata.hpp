#pragma once

#include "onova/version.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>

namespace onova {

// Identity of the application being updated.
struct AssemblyMetadata {
    std::string name;        // storage key; defaults to executable
    std::string executable;
    Version version;
    std::string file_path;   // absolute

    AssemblyMetadata() = default;
    AssemblyMetadata(std::string executable, Version version, std::string file_path,
                     std::string name = {});

    // Metadata for the running process, resolved through /proc/self/exe.
    static std::expected<AssemblyMetadata, Result> FromCurrentProcess(const Version& version,
                                                                      std::string name = {});
};

} // namespace onova
