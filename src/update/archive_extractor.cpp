#include "update/archive_extractor.hpp"

#include "update/archive_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace extupd {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

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

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

Result OpenForRead(const std::string& path, ArchiveReadPtr& out) {
    out.reset(archive_read_new());
    if (!out) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(out.get());
    archive_read_support_format_all(out.get());

    if (archive_read_open_filename(out.get(), path.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return Result::Fail(archive_errno(out.get()),
                            "Could not open archive " + path + ": " + ArchiveErr(out.get()));
    }
    return Result::Ok();
}

} // namespace

Result ArchiveExtractor::ExtractAll(const std::string& archive_path,
                                    const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(-1, "Destination path is not a directory: " + dst_dir);
    }

    ArchiveReadPtr ar;
    auto open_res = OpenForRead(archive_path, ar);
    if (!open_res.is_ok()) return open_res;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.restore_permissions) {
        flags |= ARCHIVE_EXTRACT_PERM;
    }
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    archive_entry* entry = nullptr;
    size_t entries = 0;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(-1, "archive_read_data_block: " + ArchiveErr(ar.get()));

            const int ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Result::Fail(-1, "archive_write_data_block: " + ArchiveErr(aw.get()));
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Result::Fail(-1, "archive_write_finish_entry: " + ArchiveErr(aw.get()));
        ++entries;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogDebug("Extracted %zu entries from %s into %s", entries, archive_path.c_str(), dst_dir.c_str());
    return Result::Ok();
}

Result ReadArchiveEntry(const std::string& archive_path,
                        std::string_view entry_name,
                        std::string& out,
                        bool& found) {
    found = false;
    out.clear();

    ArchiveReadPtr ar;
    auto open_res = OpenForRead(archive_path, ar);
    if (!open_res.is_ok()) {
        // Not an archive (or an empty file): nothing to find.
        LogDebug("%s", open_res.msg.c_str());
        return Result::Ok();
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            LogDebug("archive_read_next_header(%s): %s", archive_path.c_str(), ArchiveErr(ar.get()).c_str());
            return Result::Ok();
        }

        const char* raw_name = archive_entry_pathname(entry);
        const std::string name = NormalizeArchivePath(raw_name ? raw_name : "");
        if (name != entry_name) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        char buf[8192];
        while (true) {
            const la_ssize_t n = archive_read_data(ar.get(), buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) {
                return Result::Fail(-1, "Failed to read " + std::string(entry_name) + " from " +
                                            archive_path + ": " + ArchiveErr(ar.get()));
            }
            out.append(buf, static_cast<size_t>(n));
        }
        found = true;
        break;
    }

    return Result::Ok();
}

bool HasArchiveExtension(std::string_view file_name) {
    return EndsWith(file_name, ".zip") || EndsWith(file_name, ".tar") ||
           EndsWith(file_name, ".tar.gz") || EndsWith(file_name, ".tgz");
}

} // namespace extupd
