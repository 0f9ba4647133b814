#pragma once

#include <expected>
#include <string>
#include <vector>

namespace onova {

inline constexpr int kUpdaterArgCount = 5;

// Positional argument contract between the manager and the helper process:
//   <updatee> <content dir> <restart True|False> <base64 routed args> <base64 ';'-joined executables>
// Base64 keeps arbitrary quoting in the routed arguments intact.
struct UpdaterArgs {
    std::string updatee_file_path;
    std::string package_content_dir_path;
    bool restart = false;
    std::string routed_args;
    std::vector<std::string> additional_executables;

    std::vector<std::string> Encode() const;
    static std::expected<UpdaterArgs, std::string> Decode(const std::vector<std::string>& positional);
};

} // namespace onova
