#include "update/install_stager.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace extupd {

InstallStager::InstallStager(IActionLog& action_log,
                             IExtensionInstaller& installer,
                             IExtensionRegistry& registry)
    : action_log_(action_log), installer_(installer), registry_(registry) {}

Result InstallStager::Stage(const std::optional<std::string>& deferred_delete_path,
                            const std::string& local_file,
                            const std::string& display_name,
                            const ExtensionDescriptor& descriptor,
                            const std::optional<std::string>& leftover_dir) {
    // A queued delete without a replacement would uninstall the extension.
    std::error_code ec;
    if (!std::filesystem::exists(local_file, ec)) {
        return Result::Fail(ErrorKind::IOFailure, "staged file is missing: " + local_file);
    }

    ActionBatch batch;
    if (deferred_delete_path && !deferred_delete_path->empty()) {
        auto res = batch.AppendDeleteCommand(*deferred_delete_path);
        if (!res.is_ok()) return res;
    }

    auto res = installer_.Install(local_file, display_name, /*overwrite=*/true, batch);
    if (!res.is_ok()) return res;

    if (leftover_dir && !leftover_dir->empty()) {
        res = batch.AppendDeleteCommand(*leftover_dir);
        if (!res.is_ok()) return res;
    }

    res = action_log_.AppendAll(batch.Commands());
    if (!res.is_ok()) return res;

    registry_.MarkUpdated(descriptor);
    LogInfo("Extension %s %s staged", descriptor.id.c_str(), descriptor.version.c_str());
    return Result::Ok();
}

} // namespace extupd
