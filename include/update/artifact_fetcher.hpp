#pragma once

#include "io/temp_file.hpp"
#include "system/cancel_token.hpp"
#include "update/http_transport.hpp"
#include "update/progress.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace extupd {

struct FetchRequest {
    std::string url;
    std::string destination_dir;
    bool force_secure = false;
    // Final file name known up front (catalog data); skips header / URL guessing.
    std::optional<std::string> file_name_hint;
    // Used for progress events and log lines.
    std::string display_name;
    long connect_timeout_sec = 0;
};

class ArtifactFetcher {
  public:
    explicit ArtifactFetcher(const IHttpTransport& transport, IProgress* progress_sink = nullptr);

    // Downloads req.url into req.destination_dir. On success out owns the
    // file, named after the resolved file name. On failure nothing created by
    // this call is left behind.
    Result Fetch(const FetchRequest& req, const CancelToken& cancel, TempFile& out) const;

    // Value of the filename= directive, unquoted; nullopt when absent.
    static std::optional<std::string> FileNameFromContentDisposition(std::string_view header);

    // Content-Disposition, then the resolved URL, then the request URL.
    static std::string GuessFileName(const std::string& request_url, const HttpResponse& response);

  private:
    const IHttpTransport& transport_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace extupd
