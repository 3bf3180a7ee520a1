#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <sys/types.h>

namespace extupd {

// Owning wrapper around a POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    // Gives up ownership without closing.
    int Release();

    // Writes all of data, retrying short writes and EINTR.
    Result WriteAll(std::string_view data) const;
    Result Sync() const;
    void Close();

  private:
    int fd_{-1};
};

} // namespace extupd
