#pragma once

#include "update/descriptor.hpp"
#include "update/extension_registry.hpp"

#include <string>

namespace extupd {

// Decides whether a candidate version supersedes an installed extension.
class VersionArbiter {
  public:
    explicit VersionArbiter(const IExtensionRegistry& registry) : registry_(registry) {}

    // >0 when candidate_version should replace installed. A release on the
    // known-broken list is always replaceable, even by an older version.
    int Compare(const std::string& candidate_version, const ExtensionDescriptor& installed) const;

  private:
    const IExtensionRegistry& registry_;
};

} // namespace extupd
