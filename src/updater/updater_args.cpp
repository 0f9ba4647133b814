#include "updater/updater_args.hpp"

#include "util/base64.hpp"

#include <cctype>

namespace onova {

namespace {

std::string JoinPaths(const std::vector<std::string>& paths) {
    std::string out;
    for (const auto& p : paths) {
        if (!out.empty()) out.push_back(';');
        out += p;
    }
    return out;
}

std::vector<std::string> SplitPaths(const std::string& joined) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= joined.size()) {
        const size_t pos = joined.find(';', start);
        const size_t end = (pos == std::string::npos) ? joined.size() : pos;
        if (end > start) out.push_back(joined.substr(start, end - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

std::expected<bool, std::string> ParseBool(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "true") return true;
    if (s == "false") return false;
    return std::unexpected("invalid restart flag: " + s);
}

} // namespace

std::vector<std::string> UpdaterArgs::Encode() const {
    return {
        updatee_file_path,
        package_content_dir_path,
        restart ? "True" : "False",
        Base64Encode(routed_args),
        Base64Encode(JoinPaths(additional_executables)),
    };
}

std::expected<UpdaterArgs, std::string> UpdaterArgs::Decode(const std::vector<std::string>& positional) {
    if (positional.size() != kUpdaterArgCount) {
        return std::unexpected("expected " + std::to_string(kUpdaterArgCount) +
                               " arguments, got " + std::to_string(positional.size()));
    }

    UpdaterArgs out;
    out.updatee_file_path = positional[0];
    out.package_content_dir_path = positional[1];
    if (out.updatee_file_path.empty() || out.package_content_dir_path.empty()) {
        return std::unexpected("updatee path and package content path must not be empty");
    }

    auto restart = ParseBool(positional[2]);
    if (!restart) return std::unexpected(restart.error());
    out.restart = *restart;

    auto routed = Base64Decode(positional[3]);
    if (!routed) return std::unexpected("routed args: " + routed.error());
    out.routed_args = std::move(*routed);

    auto executables = Base64Decode(positional[4]);
    if (!executables) return std::unexpected("additional executables: " + executables.error());
    out.additional_executables = SplitPaths(*executables);

    return out;
}

} // namespace onova
