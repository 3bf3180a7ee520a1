#pragma once

#include <expected>
#include <string>

namespace extupd {

// Lower-cased scheme of an absolute URL; empty when url does not parse.
std::string UrlScheme(const std::string& url);

// url unchanged when absolute, otherwise resolved against host.
std::expected<std::string, std::string> ResolveAgainstHost(const std::string& host, const std::string& url);

// <download_url>?action=download&id=<id>&build=<build>&uuid=<uuid>
std::expected<std::string, std::string> BuildRepositoryDownloadUrl(const std::string& download_url,
                                                                   const std::string& extension_id,
                                                                   const std::string& build,
                                                                   const std::string& installation_id);

} // namespace extupd
