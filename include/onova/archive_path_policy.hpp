#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace onova {

// Maps raw archive entry names to clean relative paths and rejects any that
// could land outside the extraction root.
class ArchivePathPolicy {
  public:
    // Strips "./" segments, duplicate and trailing slashes. An empty result
    // means the entry names the root itself.
    static std::string Normalize(std::string_view raw_path);

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(std::string_view p);
};

} // namespace onova
