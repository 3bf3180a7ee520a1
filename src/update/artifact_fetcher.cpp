#include "update/artifact_fetcher.hpp"

#include "update/repository_url.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace extupd {

namespace {

constexpr std::string_view kFileNameDirective = "filename=";

} // namespace

ArtifactFetcher::ArtifactFetcher(const IHttpTransport& transport, IProgress* progress_sink)
    : transport_(transport), progress_sink_(progress_sink) {}

std::optional<std::string> ArtifactFetcher::FileNameFromContentDisposition(std::string_view header) {
    const auto start = header.find(kFileNameDirective);
    if (start == std::string_view::npos) return std::nullopt;

    std::string_view value = header.substr(start + kFileNameDirective.size());
    const auto end = value.find(';');
    if (end != std::string_view::npos) value = value.substr(0, end);

    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

std::string ArtifactFetcher::GuessFileName(const std::string& request_url, const HttpResponse& response) {
    if (auto from_header = FileNameFromContentDisposition(response.content_disposition)) {
        LogDebug("file name from Content-Disposition: %s", from_header->c_str());
        return *from_header;
    }

    const std::string& used_url = response.resolved_url.empty() ? request_url : response.resolved_url;
    std::string name = LastPathSegment(used_url);
    if (name.empty() || name.find('?') != std::string::npos) {
        name = LastPathSegment(request_url);
    }
    return name;
}

Result ArtifactFetcher::Fetch(const FetchRequest& req, const CancelToken& cancel, TempFile& out) const {
    std::error_code ec;
    fs::create_directories(req.destination_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot create directory " + req.destination_dir + ": " + ec.message(),
                            ec.value());
    }

    if (cancel.IsCancelled()) {
        return Result::Fail(ErrorKind::Cancelled, "download cancelled: " + req.url);
    }

    if (req.force_secure && UrlScheme(req.url) != "https") {
        return Result::Fail(ErrorKind::TransportFailure, "insecure URL rejected: " + req.url);
    }

    TempFile tmp;
    auto create_res = TempFile::Create(req.destination_dir, "ext_", ".download", tmp);
    if (!create_res.is_ok()) return create_res;

    LogInfo("Downloading %s from %s", req.display_name.c_str(), req.url.c_str());

    HttpRequest http;
    http.url = req.url;
    http.force_https = req.force_secure;
    http.disable_content_decoding = true;
    http.connect_timeout_sec = req.connect_timeout_sec;

    // Polled by the transport on every chunk; false aborts the transfer.
    const TransferCallback on_transfer = [&](std::uint64_t done, std::uint64_t total) {
        if (cancel.IsCancelled()) return false;
        if (progress_sink_) {
            progress_sink_->OnProgress(ProgressEvent{req.display_name, done, total});
        }
        return !cancel.IsCancelled();
    };

    HttpResponse response;
    auto dl_res = transport_.Download(http, tmp.GetFd(), on_transfer, response);
    if (!dl_res.is_ok()) {
        LogWarn("Download of %s failed: %s", req.url.c_str(), dl_res.msg.c_str());
        return dl_res;
    }

    auto sync_res = tmp.Sync();
    if (!sync_res.is_ok()) {
        sync_res.kind = ErrorKind::IOFailure;
        return sync_res;
    }
    tmp.Close();

    const std::string file_name =
        req.file_name_hint ? *req.file_name_hint : GuessFileName(req.url, response);
    if (!IsValidFileName(file_name)) {
        return Result::Fail(ErrorKind::ValidationFailure,
                            "Invalid filename returned by a server: '" + file_name + "'");
    }

    const std::string final_path = (fs::path(req.destination_dir) / file_name).string();
    auto rename_res = tmp.RenameTo(final_path);
    if (!rename_res.is_ok()) return rename_res;

    LogInfo("Downloaded %s (%llu bytes) to %s",
            req.display_name.c_str(),
            (unsigned long long)response.bytes_received,
            final_path.c_str());

    out = std::move(tmp);
    return Result::Ok();
}

} // namespace extupd
