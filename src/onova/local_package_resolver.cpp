#include "onova/local_package_resolver.hpp"

#include "crypto/sha256.hpp"
#include "io/atomic_file_writer.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace onova {

namespace {

// Forwards to the destination while hashing the same bytes.
class HashingWriter final : public IWriter {
  public:
    HashingWriter(IWriter& inner, Sha256Hasher& hasher) : inner_(inner), hasher_(hasher) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        hasher_.Update(in);
        return inner_.WriteAll(in);
    }
    Result FsyncNow() override { return inner_.FsyncNow(); }

  private:
    IWriter& inner_;
    Sha256Hasher& hasher_;
};

std::vector<std::pair<Version, fs::path>> ListPackages(const std::string& dir,
                                                       const std::string& ext,
                                                       std::error_code& ec) {
    std::vector<std::pair<Version, fs::path>> out;
    const std::string suffix = "." + ext;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string name = it->path().filename().string();
        if (name.size() <= suffix.size() || !name.ends_with(suffix)) continue;

        auto v = Version::TryParse(std::string_view(name).substr(0, name.size() - suffix.size()));
        if (v) out.emplace_back(*v, it->path());
    }
    return out;
}

// First whitespace-separated token of a "<hex>  <name>" style sidecar.
std::optional<std::string> ReadSidecarDigest(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream is(path);
    std::string token;
    if (!(is >> token)) return std::string();
    return token;
}

} // namespace

LocalPackageResolver::LocalPackageResolver(std::string repository_dir, std::string package_extension)
    : repository_dir_(std::move(repository_dir)), package_extension_(std::move(package_extension)) {
    if (!package_extension_.empty() && package_extension_.front() == '.') {
        package_extension_.erase(0, 1);
    }
}

Result LocalPackageResolver::GetPackageVersions(const CancelToken& cancel, std::vector<Version>& out) {
    out.clear();
    if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "version query cancelled");

    std::error_code ec;
    auto packages = ListPackages(repository_dir_, package_extension_, ec);
    if (ec) {
        return Result::Fail(UpdateErrc::ResolverFailure,
                            "cannot list repository " + repository_dir_ + ": " + ec.message());
    }

    for (auto& [version, path] : packages) out.push_back(version);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return Result::Ok();
}

std::optional<std::string> LocalPackageResolver::FindPackageFile(const Version& version) const {
    std::error_code ec;
    for (auto& [v, path] : ListPackages(repository_dir_, package_extension_, ec)) {
        if (v == version) return path.string();
    }
    return std::nullopt;
}

Result LocalPackageResolver::DownloadPackage(const Version& version,
                                             const std::string& destination_path,
                                             IProgress* progress,
                                             const CancelToken& cancel) {
    if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "download cancelled");

    const auto source = FindPackageFile(version);
    if (!source) {
        return Result::Fail(UpdateErrc::ResolverFailure,
                            "package " + version.ToString() + " not found in " + repository_dir_);
    }

    FileReader reader;
    if (auto r = FileReader::Open(*source, reader); !r.is_ok()) {
        return Result::Fail(UpdateErrc::ResolverFailure, r.message());
    }
    const std::uint64_t total = reader.TotalSize().value_or(0);

    AtomicFileWriter writer;
    if (auto r = AtomicFileWriter::Open(destination_path, 0644, writer, ".part"); !r.is_ok()) return r;

    Sha256Hasher hasher;
    HashingWriter hashing(writer, hasher);

    auto on_chunk = [&](std::uint64_t copied) -> Result {
        if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "download cancelled");
        if (progress && total > 0) {
            progress->Report(static_cast<double>(copied) / static_cast<double>(total));
        }
        return Result::Ok();
    };
    if (auto r = CopyStream(reader, hashing, on_chunk); !r.is_ok()) return r;

    if (const auto expected = ReadSidecarDigest(*source + ".sha256")) {
        const std::string actual = hasher.FinalHex();
        if (!DigestEquals(*expected, actual)) {
            return Result::Fail(UpdateErrc::ResolverFailure,
                                "checksum mismatch for " + *source + ": expected " + *expected +
                                    ", got " + actual);
        }
        LogDebug("checksum ok for %s", source->c_str());
    }

    if (auto r = writer.Commit(); !r.is_ok()) return r;
    if (progress) progress->Report(1.0);
    return Result::Ok();
}

} // namespace onova
