#include "onova/archive_package_extractor.hpp"

#include "onova/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <filesystem>
#include <memory>

namespace onova {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

Result Fail(const std::string& what, archive* a) {
    return Result::Fail(UpdateErrc::ExtractorFailure, what + ": " + ArchiveErr(a));
}

} // namespace

Result ArchivePackageExtractor::ExtractPackage(const std::string& archive_path,
                                               const std::string& destination_dir,
                                               IProgress* progress,
                                               const CancelToken& cancel) {
    namespace fs = std::filesystem;

    const fs::path base_dir(destination_dir);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(UpdateErrc::ExtractorFailure,
                            "Destination path is not a directory: " + destination_dir);
    }
    const auto archive_size = fs::file_size(archive_path, ec);
    const std::uint64_t total = ec ? 0 : static_cast<std::uint64_t>(archive_size);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(UpdateErrc::ExtractorFailure, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Fail("Could not open archive " + archive_path, ar.get());
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(UpdateErrc::ExtractorFailure, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under base_dir, so
    // SECURE_NOABSOLUTEPATHS cannot be used here.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const ArchivePathPolicy path_policy;

    auto report = [&]() {
        if (!progress || total == 0) return;
        const auto consumed = static_cast<double>(archive_filter_bytes(ar.get(), -1));
        progress->Report(std::min(1.0, consumed / static_cast<double>(total)));
    };

    std::size_t entries = 0;
    archive_entry* entry = nullptr;

    while (true) {
        if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "extraction cancelled");

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) return Fail("archive_read_next_header", ar.get());

        std::string rel;
        if (auto pr = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel); !pr.is_ok()) {
            return pr;
        }
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        if (auto hr = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl); !hr.is_ok()) {
            return hr;
        }
        if (!rel_hl.empty()) {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", rel.c_str());

        if (archive_write_header(aw.get(), entry) < ARCHIVE_WARN) {
            return Fail("archive_write_header " + rel, aw.get());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            if (cancel.IsCancelled()) return Result::Fail(UpdateErrc::Cancelled, "extraction cancelled");

            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr < ARCHIVE_WARN) return Fail("archive_read_data_block " + rel, ar.get());

            if (archive_write_data_block(aw.get(), buff, size, offset) < ARCHIVE_WARN) {
                return Fail("archive_write_data_block " + rel, aw.get());
            }
            report();
        }

        if (archive_write_finish_entry(aw.get()) < ARCHIVE_WARN) {
            return Fail("archive_write_finish_entry " + rel, aw.get());
        }
        ++entries;
    }

    // Directory permissions and times are applied on close.
    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Fail("archive_write_close", aw.get());
    }

    if (progress) progress->Report(1.0);
    LogDebug("extracted %zu entries from %s", entries, archive_path.c_str());
    return Result::Ok();
}

} // namespace onova
