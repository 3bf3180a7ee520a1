#pragma once

#include "update/build_number.hpp"
#include "update/descriptor.hpp"
#include "update/manifest_reader.hpp"
#include "util/result.hpp"

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace extupd {

class IExtensionRegistry {
  public:
    virtual ~IExtensionRegistry() = default;

    virtual bool IsInstalled(const std::string& id) const = 0;
    virtual std::optional<ExtensionDescriptor> GetInstalled(const std::string& id) const = 0;
    virtual bool IsIncompatible(const ExtensionDescriptor& descriptor, const BuildNumber& build) const = 0;
    virtual bool IsKnownBroken(const ExtensionDescriptor& descriptor) const = 0;
    virtual bool WasUpdatedThisSession(const std::string& id) const = 0;
    virtual void MarkUpdated(const ExtensionDescriptor& descriptor) = 0;
};

// True when build lies outside [since_build, until_build]. Bounds that do not
// parse are ignored.
bool IsOutsideBuildRange(const ExtensionDescriptor& descriptor, const BuildNumber& build);

// Releases known to be broken, keyed by extension id.
// File format: { "<id>": ["<version>", ...], ... }
class BrokenList {
  public:
    static Result LoadFromFile(const std::string& path, BrokenList& out);

    void Add(const std::string& id, const std::string& version);
    bool Contains(const std::string& id, const std::string& version) const;
    size_t Size() const;

  private:
    std::unordered_map<std::string, std::set<std::string>> versions_by_id_;
};

// Thread-safe registry of installed extensions. Reads share a lock, writes
// are exclusive.
class ExtensionRegistry final : public IExtensionRegistry {
  public:
    ExtensionRegistry() = default;
    ExtensionRegistry(const ExtensionRegistry&) = delete;
    ExtensionRegistry& operator=(const ExtensionRegistry&) = delete;

    // Registers every entry of extensions_dir that carries a manifest.
    Result ScanDirectory(const std::string& extensions_dir, const IManifestReader& reader);

    void AddInstalled(ExtensionDescriptor descriptor);
    void SetBrokenList(BrokenList broken);

    bool IsInstalled(const std::string& id) const override;
    std::optional<ExtensionDescriptor> GetInstalled(const std::string& id) const override;
    bool IsIncompatible(const ExtensionDescriptor& descriptor, const BuildNumber& build) const override;
    bool IsKnownBroken(const ExtensionDescriptor& descriptor) const override;
    bool WasUpdatedThisSession(const std::string& id) const override;
    void MarkUpdated(const ExtensionDescriptor& descriptor) override;

  private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, ExtensionDescriptor> installed_;
    std::unordered_set<std::string> updated_;
    BrokenList broken_;
};

} // namespace extupd
