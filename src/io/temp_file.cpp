#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace extupd {

Result TempFile::Create(const std::string& dir,
                        const std::string& prefix,
                        const std::string& suffix,
                        TempFile& out) {
    std::string tmpl = dir;
    if (!tmpl.empty() && tmpl.back() != '/') tmpl.push_back('/');
    tmpl += prefix + "XXXXXX" + suffix;

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot create temporary file in " + dir + ": " + std::strerror(err),
                            err);
    }
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile TempFile::Adopt(std::string path) {
    TempFile t;
    t.path_ = std::move(path);
    return t;
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

Result TempFile::RenameTo(const std::string& new_path) {
    Close();
    if (::rename(path_.c_str(), new_path.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot rename " + path_ + " to " + new_path + ": " + std::strerror(err),
                            err);
    }
    path_ = new_path;
    return Result::Ok();
}

std::string TempFile::Release() {
    Close();
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace extupd
