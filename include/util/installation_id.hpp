#pragma once

#include "util/result.hpp"

#include <string>

namespace extupd {

// Random RFC 4122 version 4 UUID, lower-case hex.
Result GenerateUuidV4(std::string& out);

// Reads the identifier stored at path, creating and persisting a new one when
// the file is missing or empty.
Result LoadOrCreateInstallationId(const std::string& path, std::string& out);

} // namespace extupd
