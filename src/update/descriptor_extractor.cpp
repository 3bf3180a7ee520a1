#include "update/descriptor_extractor.hpp"

#include "io/scratch_dir.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace extupd {

DescriptorExtractor::DescriptorExtractor(const IManifestReader& manifest_reader,
                                         const IArchiveExtractor& archive_extractor,
                                         std::string scratch_base_dir)
    : manifest_reader_(manifest_reader),
      archive_extractor_(archive_extractor),
      scratch_base_dir_(std::move(scratch_base_dir)) {}

Result DescriptorExtractor::Extract(const std::string& local_file,
                                    std::optional<ExtensionDescriptor>& out) const {
    out = manifest_reader_.ReadManifest(local_file);
    if (out) {
        LogDebug("Descriptor read from package %s", local_file.c_str());
        return Result::Ok();
    }

    if (!HasArchiveExtension(fs::path(local_file).filename().string())) {
        return Result::Ok();
    }

    ScratchDir scratch;
    auto create_res = ScratchDir::Create(scratch_base_dir_, "ext-inspect-", scratch);
    if (!create_res.is_ok()) return create_res;

    auto extract_res = archive_extractor_.ExtractAll(local_file, scratch.Path());
    if (!extract_res.is_ok()) {
        extract_res.kind = ErrorKind::IOFailure;
        extract_res.msg = "Cannot unpack " + local_file + ": " + extract_res.msg;
        return extract_res;
    }

    std::error_code ec;
    std::vector<fs::path> top_level;
    for (const auto& entry : fs::directory_iterator(scratch.Path(), ec)) {
        top_level.push_back(entry.path());
    }
    if (ec) {
        return Result::Fail(ErrorKind::IOFailure,
                            "cannot list " + scratch.Path() + ": " + ec.message(), ec.value());
    }

    if (top_level.size() != 1) {
        LogDebug("%s has %zu top-level entries, no descriptor", local_file.c_str(), top_level.size());
        return Result::Ok();
    }

    out = manifest_reader_.ReadManifest(top_level.front().string());
    if (out) {
        // The scratch copy is about to disappear.
        out->path.clear();
    }
    return Result::Ok();
}

} // namespace extupd
