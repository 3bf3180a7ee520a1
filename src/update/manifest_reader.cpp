#include "update/manifest_reader.hpp"

#include "update/archive_extractor.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace extupd {

std::optional<ExtensionDescriptor> PackageManifestReader::ReadManifest(const std::string& path) const {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        LogDebug("ReadManifest: cannot stat %s: %s", path.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    std::optional<ExtensionDescriptor> descriptor;
    if (fs::is_directory(status)) {
        descriptor = ReadFromDirectory(path);
    } else if (fs::is_regular_file(status)) {
        descriptor = ReadFromPackage(path);
    }

    if (descriptor) {
        descriptor->path = path;
    }
    return descriptor;
}

std::optional<ExtensionDescriptor> PackageManifestReader::ReadFromPackage(const std::string& path) const {
    std::string json;
    bool found = false;
    auto res = ReadArchiveEntry(path, kManifestEntry, json, found);
    if (!res.is_ok()) {
        LogWarn("%s", res.msg.c_str());
        return std::nullopt;
    }
    if (!found) return std::nullopt;
    return ParseManifest(json, path);
}

std::optional<ExtensionDescriptor> PackageManifestReader::ReadFromDirectory(const std::string& path) const {
    const fs::path dir(path);
    const fs::path manifest = dir / kManifestEntry;

    std::error_code ec;
    if (fs::is_regular_file(manifest, ec)) {
        std::ifstream is(manifest);
        if (!is.good()) {
            LogWarn("cannot open %s", manifest.c_str());
            return std::nullopt;
        }
        std::ostringstream ss;
        ss << is.rdbuf();
        return ParseManifest(ss.str(), manifest.string());
    }

    const fs::path lib = dir / "lib";
    if (!fs::is_directory(lib, ec)) return std::nullopt;

    std::vector<fs::path> packages;
    for (const auto& entry : fs::directory_iterator(lib, ec)) {
        if (entry.is_regular_file(ec)) packages.push_back(entry.path());
    }
    // Deterministic pick when several libraries are present.
    std::sort(packages.begin(), packages.end());

    for (const auto& package : packages) {
        if (auto d = ReadFromPackage(package.string())) return d;
    }
    return std::nullopt;
}

std::optional<ExtensionDescriptor> PackageManifestReader::ParseManifest(const std::string& json,
                                                                        const std::string& origin) const {
    auto parsed = parser_.Parse(json);
    if (!parsed) {
        LogWarn("Invalid manifest in %s: %s", origin.c_str(), parsed.error().c_str());
        return std::nullopt;
    }
    return std::move(*parsed);
}

} // namespace extupd
