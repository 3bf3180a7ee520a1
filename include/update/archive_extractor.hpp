#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace extupd {

class IArchiveExtractor {
  public:
    virtual ~IArchiveExtractor() = default;

    // Unpacks every entry of archive_path below dst_dir, which must exist.
    virtual Result ExtractAll(const std::string& archive_path, const std::string& dst_dir) const = 0;
};

class ArchiveExtractor final : public IArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        bool restore_permissions = true;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractAll(const std::string& archive_path, const std::string& dst_dir) const override;

  private:
    Options opt_{};
};

// Reads a single entry of an archive into memory. Sets found=false (and
// returns Ok) when the file is readable as an archive but has no such entry,
// or when the file is not an archive at all.
Result ReadArchiveEntry(const std::string& archive_path,
                        std::string_view entry_name,
                        std::string& out,
                        bool& found);

// ".zip", ".tar", ".tar.gz", ".tgz"
bool HasArchiveExtension(std::string_view file_name);

} // namespace extupd
