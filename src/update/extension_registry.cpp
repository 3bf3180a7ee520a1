#include "update/extension_registry.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace extupd {

namespace {

std::optional<BuildNumber> ParseBound(const std::string& text, const ExtensionDescriptor& d, const char* which) {
    if (text.empty()) return std::nullopt;
    auto parsed = BuildNumber::Parse(text);
    if (!parsed) {
        LogWarn("Extension %s: ignoring %s '%s': %s",
                d.id.c_str(), which, text.c_str(), parsed.error().c_str());
        return std::nullopt;
    }
    return *parsed;
}

} // namespace

bool IsOutsideBuildRange(const ExtensionDescriptor& descriptor, const BuildNumber& build) {
    if (build.Empty()) return false;

    if (auto since = ParseBound(descriptor.since_build, descriptor, "since_build")) {
        if (build.CompareTo(*since) < 0) return true;
    }
    if (auto until = ParseBound(descriptor.until_build, descriptor, "until_build")) {
        if (build.CompareTo(*until) > 0) return true;
    }
    return false;
}

Result BrokenList::LoadFromFile(const std::string& path, BrokenList& out) {
    out = BrokenList{};

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::IOFailure, "cannot open broken list: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::ValidationFailure,
                            std::string("invalid JSON in ") + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(ErrorKind::ValidationFailure, "broken list must be JSON object: " + path);
    }

    for (const auto& [id, versions] : j.items()) {
        if (!versions.is_array()) {
            return Result::Fail(ErrorKind::ValidationFailure, "broken list entry must be an array: " + id);
        }
        for (const auto& v : versions) {
            if (!v.is_string()) {
                return Result::Fail(ErrorKind::ValidationFailure, "broken version must be a string: " + id);
            }
            out.Add(id, v.get<std::string>());
        }
    }

    return Result::Ok();
}

void BrokenList::Add(const std::string& id, const std::string& version) {
    versions_by_id_[id].insert(version);
}

bool BrokenList::Contains(const std::string& id, const std::string& version) const {
    auto it = versions_by_id_.find(id);
    return it != versions_by_id_.end() && it->second.count(version) > 0;
}

size_t BrokenList::Size() const {
    size_t n = 0;
    for (const auto& [id, versions] : versions_by_id_) n += versions.size();
    return n;
}

Result ExtensionRegistry::ScanDirectory(const std::string& extensions_dir, const IManifestReader& reader) {
    std::error_code ec;
    if (!fs::exists(extensions_dir, ec)) {
        LogInfo("Extensions directory %s does not exist yet", extensions_dir.c_str());
        return Result::Ok();
    }

    fs::directory_iterator it(extensions_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot list " + extensions_dir + ": " + ec.message(), ec.value());
    }

    size_t found = 0;
    for (const auto& entry : it) {
        auto descriptor = reader.ReadManifest(entry.path().string());
        if (!descriptor) {
            LogDebug("skip: %s (no manifest)", entry.path().c_str());
            continue;
        }
        LogDebug("installed: %s %s at %s",
                 descriptor->id.c_str(), descriptor->version.c_str(), descriptor->path.c_str());
        AddInstalled(std::move(*descriptor));
        ++found;
    }

    LogInfo("Found %zu installed extensions in %s", found, extensions_dir.c_str());
    return Result::Ok();
}

void ExtensionRegistry::AddInstalled(ExtensionDescriptor descriptor) {
    std::unique_lock lk(mu_);
    const std::string id = descriptor.id;
    installed_[id] = std::move(descriptor);
}

void ExtensionRegistry::SetBrokenList(BrokenList broken) {
    std::unique_lock lk(mu_);
    broken_ = std::move(broken);
}

bool ExtensionRegistry::IsInstalled(const std::string& id) const {
    std::shared_lock lk(mu_);
    return installed_.count(id) > 0;
}

std::optional<ExtensionDescriptor> ExtensionRegistry::GetInstalled(const std::string& id) const {
    std::shared_lock lk(mu_);
    auto it = installed_.find(id);
    if (it == installed_.end()) return std::nullopt;
    return it->second;
}

bool ExtensionRegistry::IsIncompatible(const ExtensionDescriptor& descriptor, const BuildNumber& build) const {
    return IsOutsideBuildRange(descriptor, build);
}

bool ExtensionRegistry::IsKnownBroken(const ExtensionDescriptor& descriptor) const {
    std::shared_lock lk(mu_);
    return broken_.Contains(descriptor.id, descriptor.version);
}

bool ExtensionRegistry::WasUpdatedThisSession(const std::string& id) const {
    std::shared_lock lk(mu_);
    return updated_.count(id) > 0;
}

void ExtensionRegistry::MarkUpdated(const ExtensionDescriptor& descriptor) {
    std::unique_lock lk(mu_);
    updated_.insert(descriptor.id);
}

} // namespace extupd
