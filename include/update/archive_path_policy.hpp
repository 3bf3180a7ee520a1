#pragma once

#include "util/result.hpp"

#include <string>

namespace extupd {

// Maps archive entry names and hardlink targets onto relative paths that
// cannot escape the extraction directory.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    Result Normalize(const char* raw_path, const char* what, std::string& out_relative) const;

    bool safe_paths_only_ = true;
};

} // namespace extupd
