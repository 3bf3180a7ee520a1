#pragma once

#include <string>
#include <vector>

namespace extupd {

// Metadata of one extension, either read from its manifest or taken from a
// repository catalog entry.
struct ExtensionDescriptor {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> depends;

    // Host build range, empty means unbounded.
    std::string since_build;
    std::string until_build;

    // Catalog download location; may be relative to the repository host.
    std::string url;

    // On-disk location of an installed extension, empty otherwise.
    std::string path;
};

} // namespace extupd
