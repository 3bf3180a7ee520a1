#pragma once

#include "util/result.hpp"

#include <string>

namespace extupd {

// Uniquely named directory that is removed recursively on destruction.
class ScratchDir {
  public:
    static Result Create(const std::string& base_dir, const std::string& prefix, ScratchDir& out);

    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ~ScratchDir();

    const std::string& Path() const { return path_; }
    bool Empty() const { return path_.empty(); }

    // Stops owning the directory and returns its path.
    std::string Release();

  private:
    void Cleanup();

    std::string path_;
};

} // namespace extupd
