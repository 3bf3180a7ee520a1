#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace extupd {

// Owns a file on disk: the file is unlinked on destruction unless ownership
// was handed over with Release().
class TempFile {
public:
    // Creates <dir>/<prefix>XXXXXX<suffix> with a unique name, open for writing.
    static Result Create(const std::string& dir,
                         const std::string& prefix,
                         const std::string& suffix,
                         TempFile& out);

    // Takes ownership of an existing file.
    static TempFile Adopt(std::string path);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    bool Empty() const { return path_.empty(); }

    Result Sync() const { return fd_.Sync(); }
    void Close();

    // Renames the file (closing it first); ownership follows the new path.
    Result RenameTo(const std::string& new_path);

    // Stops owning the file and returns its path.
    std::string Release();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace extupd
