#include "update/http_transport.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <strings.h>
#include <unistd.h>

namespace extupd {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct TransferCtx {
    int fd = -1;
    int write_errno = 0;
    std::uint64_t written = 0;
    const TransferCallback* on_transfer = nullptr;
    bool aborted = false;
    std::string content_disposition;
};

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t WriteCb(char* data, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferCtx*>(userp);
    const size_t total = size * nmemb;
    size_t off = 0;
    while (off < total) {
        const ssize_t n = ::write(ctx->fd, data + off, total - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            ctx->write_errno = errno;
            return 0;
        }
        off += static_cast<size_t>(n);
    }
    ctx->written += total;
    return total;
}

std::string Trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Headers arrive once per response; a status line starts a new response
// (redirect hops), so only the final response's value survives.
size_t HeaderCb(char* data, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferCtx*>(userp);
    const size_t total = size * nmemb;
    const std::string line(data, total);

    if (line.rfind("HTTP/", 0) == 0) {
        ctx->content_disposition.clear();
        return total;
    }

    static constexpr char kName[] = "content-disposition:";
    constexpr size_t kNameLen = sizeof(kName) - 1;
    if (line.size() > kNameLen && ::strncasecmp(line.c_str(), kName, kNameLen) == 0) {
        ctx->content_disposition = Trim(line.substr(kNameLen));
    }
    return total;
}

int XferInfoCb(void* userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferCtx*>(userp);
    if (!ctx->on_transfer || !*ctx->on_transfer) return 0;
    const bool keep_going = (*ctx->on_transfer)(static_cast<std::uint64_t>(dlnow < 0 ? 0 : dlnow),
                                                static_cast<std::uint64_t>(dltotal < 0 ? 0 : dltotal));
    if (!keep_going) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

} // namespace

CurlHttpTransport::CurlHttpTransport() { EnsureCurlGlobalInit(); }

Result CurlHttpTransport::Download(const HttpRequest& req,
                                   int out_fd,
                                   const TransferCallback& on_transfer,
                                   HttpResponse& out) const {
    out = HttpResponse{};

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorKind::TransportFailure, "curl_easy_init failed");

    TransferCtx ctx;
    ctx.fd = out_fd;
    ctx.on_transfer = &on_transfer;

    char errbuf[CURL_ERROR_SIZE] = {};
    const char* protocols = req.force_https ? "https" : "http,https";

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, protocols);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, protocols);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, req.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, req.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (req.disable_content_decoding) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTP_CONTENT_DECODING, 0L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    }
    if (req.connect_timeout_sec > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, req.connect_timeout_sec);
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, HeaderCb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    LogDebug("GET %s (force_https=%d)", req.url.c_str(), req.force_https ? 1 : 0);
    const CURLcode rc = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
    char* effective = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        out.resolved_url = effective;
    } else {
        out.resolved_url = req.url;
    }
    out.content_disposition = ctx.content_disposition;
    out.bytes_received = ctx.written;

    if (rc == CURLE_ABORTED_BY_CALLBACK || ctx.aborted) {
        return Result::Fail(ErrorKind::Cancelled, "download cancelled: " + req.url);
    }
    if (rc == CURLE_WRITE_ERROR && ctx.write_errno != 0) {
        return Result::Fail(ErrorKind::IOFailure,
                            std::string("cannot write download: ") + std::strerror(ctx.write_errno),
                            ctx.write_errno);
    }
    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(rc);
        return Result::Fail(ErrorKind::TransportFailure, detail + " (" + req.url + ")", static_cast<int>(rc));
    }
    if (out.status < 200 || out.status >= 300) {
        return Result::Fail(ErrorKind::TransportFailure,
                            "HTTP " + std::to_string(out.status) + " from " + out.resolved_url);
    }

    return Result::Ok();
}

} // namespace extupd
