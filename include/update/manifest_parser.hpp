#pragma once

#include "update/descriptor.hpp"

#include <expected>
#include <string>

namespace extupd {

// Name of the manifest inside a raw package or an extension directory.
inline constexpr const char kManifestEntry[] = "META-INF/plugin.json";

class ManifestParser {
  public:
    std::expected<ExtensionDescriptor, std::string> Parse(const std::string& json_input) const;
};

} // namespace extupd
