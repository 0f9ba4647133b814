#include "onova/archive_path_policy.hpp"

#include <ranges>
#include <string_view>

namespace onova {

std::string ArchivePathPolicy::Normalize(std::string_view raw_path) {
    std::string out;
    out.reserve(raw_path.size());

    const bool absolute = !raw_path.empty() && raw_path.front() == '/';
    for (auto part : raw_path | std::views::split('/')) {
        std::string_view seg(part.begin(), part.end());
        if (seg.empty() || seg == ".") continue;
        if (!out.empty()) out.push_back('/');
        out.append(seg);
    }
    if (absolute) out.insert(out.begin(), '/');
    return out;
}

bool ArchivePathPolicy::IsSafeRelativePath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    for (auto part : p | std::views::split('/')) {
        if (std::string_view(part.begin(), part.end()) == "..") return false;
    }
    return true;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    out_relative = Normalize(raw_path ? std::string_view(raw_path) : std::string_view());
    if (out_relative.empty()) return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(UpdateErrc::ExtractorFailure, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const {
    if (!raw_path || !*raw_path) {
        out_relative.clear();
        return Result::Ok();
    }

    out_relative = Normalize(raw_path);
    if (out_relative.empty()) return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(UpdateErrc::ExtractorFailure,
                            "Unsafe hardlink target in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace onova
