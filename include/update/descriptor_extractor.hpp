#pragma once

#include "update/archive_extractor.hpp"
#include "update/descriptor.hpp"
#include "update/manifest_reader.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace extupd {

// Recovers the descriptor of a downloaded artifact without installing it.
class DescriptorExtractor {
  public:
    DescriptorExtractor(const IManifestReader& manifest_reader,
                        const IArchiveExtractor& archive_extractor,
                        std::string scratch_base_dir);

    // out stays empty when the artifact carries no descriptor; that is not an
    // error. Failures are limited to I/O on the scratch directory and archives
    // that cannot be unpacked.
    Result Extract(const std::string& local_file, std::optional<ExtensionDescriptor>& out) const;

  private:
    const IManifestReader& manifest_reader_;
    const IArchiveExtractor& archive_extractor_;
    std::string scratch_base_dir_;
};

} // namespace extupd
