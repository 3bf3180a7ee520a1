#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace extupd {

namespace {

Result ErrnoFail(const std::string& what, int err) {
    return Result::Fail(ErrorKind::IOFailure, what + ": " + std::strerror(err), err);
}

} // namespace

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(std::exchange(other.fd_, -1));
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) return ErrnoFail("cannot open " + path, errno);
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() { return std::exchange(fd_, -1); }

Result Fd::WriteAll(std::string_view data) const {
    if (fd_ < 0) return ErrnoFail("write", EBADF);

    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return ErrnoFail("write", errno);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result Fd::Sync() const {
    if (fd_ < 0) return ErrnoFail("fsync", EBADF);
    if (::fsync(fd_) != 0) return ErrnoFail("fsync", errno);
    return Result::Ok();
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace extupd
