#include "io/scratch_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace extupd {

Result ScratchDir::Create(const std::string& base_dir, const std::string& prefix, ScratchDir& out) {
    out.Cleanup();

    const fs::path base = base_dir.empty() ? fs::temp_directory_path() : fs::path(base_dir);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot create directory " + base.string() + ": " + ec.message(),
                            ec.value());
    }

    std::string tmpl = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(ErrorKind::IOFailure, "mkdtemp failed: " + std::string(std::strerror(err)), err);
    }

    out.path_ = created;
    return Result::Ok();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() { Cleanup(); }

std::string ScratchDir::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void ScratchDir::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LogWarn("cannot remove %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

} // namespace extupd
