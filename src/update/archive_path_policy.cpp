#include "update/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace extupd {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        if (sv.substr(0, pos) == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::Normalize(const char* raw_path,
                                    const char* what,
                                    std::string& out_relative) const {
    out_relative = NormalizeArchivePath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (safe_paths_only_ && !IsSafeRelativePath(out_relative)) {
        return Result::Fail(ErrorKind::ValidationFailure,
                            std::string("Unsafe ") + what + " in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "path", out_relative);
}

Result ArchivePathPolicy::NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const {
    if (!raw_path || !*raw_path) {
        out_relative.clear();
        return Result::Ok();
    }
    return Normalize(raw_path, "hardlink target", out_relative);
}

} // namespace extupd
