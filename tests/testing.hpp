#pragma once

#include "system/cancel_token.hpp"
#include "update/action_script.hpp"
#include "update/extension_installer.hpp"
#include "update/http_transport.hpp"
#include "update/progress.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/ext_updater_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

    std::string Sub(const std::string& rel) const { return path_ + "/" + rel; }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline void WriteFile(const std::string& path, const std::vector<std::uint8_t>& contents) {
    WriteFile(path, std::string(contents.begin(), contents.end()));
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::ostringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

// Everything directly below dir, sorted.
inline std::vector<std::string> ListDir(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        out.push_back(entry.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

inline std::string ManifestJson(const std::string& id,
                                const std::string& version,
                                const std::string& since_build = "",
                                const std::string& until_build = "") {
    std::string j = "{\"id\":\"" + id + "\",\"name\":\"" + id + "\",\"version\":\"" + version + "\"";
    if (!since_build.empty() || !until_build.empty()) {
        j += ",\"compatibility\":{";
        bool first = true;
        if (!since_build.empty()) {
            j += "\"since_build\":\"" + since_build + "\"";
            first = false;
        }
        if (!until_build.empty()) {
            if (!first) j += ",";
            j += "\"until_build\":\"" + until_build + "\"";
        }
        j += "}";
    }
    j += "}";
    return j;
}

struct ArchiveEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

enum class ArchiveFormat { Zip, Tar };

inline std::vector<std::uint8_t> BuildArchive(const std::vector<ArchiveEntry>& entries,
                                              ArchiveFormat format = ArchiveFormat::Zip) {
    std::vector<std::uint8_t> out(1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fr = format == ArchiveFormat::Zip ? archive_write_set_format_zip(a)
                                                : archive_write_set_format_pax_restricted(a);
    if (fr != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

// Package with the manifest at its root, the way a raw .jar ships it.
inline std::vector<std::uint8_t> BuildRawPackage(const std::string& id, const std::string& version,
                                                 const std::string& since_build = "",
                                                 const std::string& until_build = "") {
    return BuildArchive({
        {"META-INF/plugin.json", ManifestJson(id, version, since_build, until_build)},
        {"com/example/Main.class", "\xca\xfe\xba\xbe"},
    });
}

// Serves a canned body instead of talking to the network.
class FakeTransport final : public extupd::IHttpTransport {
  public:
    std::string body;
    std::string content_disposition;
    std::string resolved_url;
    long status = 200;
    // Returned instead of serving the body when set.
    std::optional<extupd::Result> failure;

    mutable int calls = 0;
    mutable extupd::HttpRequest last_request;

    extupd::Result Download(const extupd::HttpRequest& req,
                            int out_fd,
                            const extupd::TransferCallback& on_transfer,
                            extupd::HttpResponse& out) const override {
        ++calls;
        last_request = req;
        out = extupd::HttpResponse{};

        if (failure) return *failure;

        const auto total = static_cast<std::uint64_t>(body.size());
        if (on_transfer && !on_transfer(0, total)) {
            return extupd::Result::Fail(extupd::ErrorKind::Cancelled, "transfer aborted");
        }

        size_t off = 0;
        while (off < body.size()) {
            const ssize_t n = ::write(out_fd, body.data() + off, body.size() - off);
            if (n < 0) {
                return extupd::Result::Fail(extupd::ErrorKind::IOFailure, "write failed", errno);
            }
            off += static_cast<size_t>(n);
        }

        if (on_transfer && !on_transfer(total, total)) {
            return extupd::Result::Fail(extupd::ErrorKind::Cancelled, "transfer aborted");
        }

        out.status = status;
        out.resolved_url = resolved_url.empty() ? req.url : resolved_url;
        out.content_disposition = content_disposition;
        out.bytes_received = total;
        return extupd::Result::Ok();
    }

    void ServeFile(const std::vector<std::uint8_t>& data) { body.assign(data.begin(), data.end()); }
};

// Cancels the token from inside the transfer, on the first progress event.
class CancellingProgress final : public extupd::IProgress {
  public:
    explicit CancellingProgress(extupd::CancelToken& token) : token_(token) {}

    int events = 0;

    void OnProgress(const extupd::ProgressEvent&) override {
        ++events;
        token_.Cancel();
    }

  private:
    extupd::CancelToken& token_;
};

class RecordingActionLog final : public extupd::IActionLog {
  public:
    std::vector<extupd::ActionCommand> commands;
    std::optional<extupd::Result> failure;

    extupd::Result AppendAll(const std::vector<extupd::ActionCommand>& batch) override {
        if (failure) return *failure;
        commands.insert(commands.end(), batch.begin(), batch.end());
        return extupd::Result::Ok();
    }
};

class RecordingInstaller final : public extupd::IExtensionInstaller {
  public:
    struct Call {
        std::string local_file;
        std::string display_name;
        bool overwrite = false;
    };

    std::vector<Call> calls;
    std::optional<extupd::Result> failure;

    // Records a copy into /installed/<display_name>, even when it then fails.
    extupd::Result Install(const std::string& local_file, const std::string& display_name,
                           bool overwrite, extupd::IActionLog& actions) override {
        calls.push_back({local_file, display_name, overwrite});
        auto res = actions.Append(extupd::ActionCommand::Copy(local_file, "/installed/" + display_name));
        if (!res.is_ok()) return res;
        if (failure) return *failure;
        return extupd::Result::Ok();
    }
};

} // namespace testutil
