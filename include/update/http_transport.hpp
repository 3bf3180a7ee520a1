#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace extupd {

struct HttpRequest {
    std::string url;
    // Only https for the target and every redirect.
    bool force_https = false;
    // Keep the body byte-exact: no Accept-Encoding, no transparent decoding.
    bool disable_content_decoding = true;
    long connect_timeout_sec = 0;
    long max_redirects = 10;
    std::string user_agent = "ext-updater/1.0";
};

struct HttpResponse {
    long status = 0;
    // URL of the last request after redirects.
    std::string resolved_url;
    // Content-Disposition of the final response, empty when absent.
    std::string content_disposition;
    std::uint64_t bytes_received = 0;
};

// Called while the body streams in. Returning false aborts the transfer.
using TransferCallback = std::function<bool(std::uint64_t done, std::uint64_t total)>;

class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;

    // GET req.url and write the body to out_fd. A callback abort is reported
    // as ErrorKind::Cancelled, non-2xx statuses and network problems as
    // ErrorKind::TransportFailure, local write errors as ErrorKind::IOFailure.
    virtual Result Download(const HttpRequest& req,
                            int out_fd,
                            const TransferCallback& on_transfer,
                            HttpResponse& out) const = 0;
};

class CurlHttpTransport final : public IHttpTransport {
  public:
    CurlHttpTransport();

    Result Download(const HttpRequest& req,
                    int out_fd,
                    const TransferCallback& on_transfer,
                    HttpResponse& out) const override;
};

} // namespace extupd
