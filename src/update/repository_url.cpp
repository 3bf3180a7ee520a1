#include "update/repository_url.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>

namespace extupd {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const {
        if (u) curl_url_cleanup(u);
    }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

std::string UrlError(CURLUcode rc) {
    return curl_url_strerror(rc);
}

std::expected<std::string, std::string> GetUrl(CURLU* h) {
    char* out = nullptr;
    const CURLUcode rc = curl_url_get(h, CURLUPART_URL, &out, 0);
    if (rc != CURLUE_OK) return std::unexpected(UrlError(rc));
    std::string url(out);
    curl_free(out);
    return url;
}

} // namespace

std::string UrlScheme(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h || curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) return {};

    char* out = nullptr;
    if (curl_url_get(h.get(), CURLUPART_SCHEME, &out, 0) != CURLUE_OK) return {};
    std::string scheme(out);
    curl_free(out);
    for (char& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return scheme;
}

std::expected<std::string, std::string> ResolveAgainstHost(const std::string& host, const std::string& url) {
    CurlUrlPtr absolute(curl_url());
    if (!absolute) return std::unexpected("out of memory");
    if (curl_url_set(absolute.get(), CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        return url;
    }

    CurlUrlPtr h(curl_url());
    if (!h) return std::unexpected("out of memory");
    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, host.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected("invalid host URL '" + host + "': " + UrlError(rc));
    }
    rc = curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected("cannot resolve '" + url + "' against '" + host + "': " + UrlError(rc));
    }
    return GetUrl(h.get());
}

std::expected<std::string, std::string> BuildRepositoryDownloadUrl(const std::string& download_url,
                                                                   const std::string& extension_id,
                                                                   const std::string& build,
                                                                   const std::string& installation_id) {
    CurlUrlPtr h(curl_url());
    if (!h) return std::unexpected("out of memory");

    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, download_url.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected("invalid repository URL '" + download_url + "': " + UrlError(rc));
    }

    const std::string params[] = {
        "action=download",
        "id=" + extension_id,
        "build=" + build,
        "uuid=" + installation_id,
    };
    for (const auto& param : params) {
        rc = curl_url_set(h.get(), CURLUPART_QUERY, param.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
        if (rc != CURLUE_OK) {
            return std::unexpected("cannot add query parameter: " + UrlError(rc));
        }
    }
    return GetUrl(h.get());
}

} // namespace extupd
