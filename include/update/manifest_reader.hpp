#pragma once

#include "update/descriptor.hpp"
#include "update/manifest_parser.hpp"

#include <optional>
#include <string>

namespace extupd {

class IManifestReader {
  public:
    virtual ~IManifestReader() = default;

    // Descriptor of the extension stored at path (a raw package file or an
    // unpacked extension directory), or nullopt when none can be found.
    virtual std::optional<ExtensionDescriptor> ReadManifest(const std::string& path) const = 0;
};

// Looks for META-INF/plugin.json:
// - inside a raw package (any archive libarchive can read),
// - directly under an extension directory,
// - inside the raw packages of an extension directory's lib/ folder.
class PackageManifestReader final : public IManifestReader {
  public:
    std::optional<ExtensionDescriptor> ReadManifest(const std::string& path) const override;

  private:
    std::optional<ExtensionDescriptor> ReadFromPackage(const std::string& path) const;
    std::optional<ExtensionDescriptor> ReadFromDirectory(const std::string& path) const;
    std::optional<ExtensionDescriptor> ParseManifest(const std::string& json,
                                                     const std::string& origin) const;

    ManifestParser parser_;
};

} // namespace extupd
