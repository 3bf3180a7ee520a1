#include "update/extension_installer.hpp"

#include "update/archive_extractor.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace extupd {

ExtensionInstaller::ExtensionInstaller(std::string extensions_dir)
    : extensions_dir_(std::move(extensions_dir)) {}

Result ExtensionInstaller::Install(const std::string& local_file,
                                   const std::string& display_name,
                                   bool overwrite,
                                   IActionLog& actions) {
    std::error_code ec;
    if (!fs::is_regular_file(local_file, ec)) {
        return Result::Fail(ErrorKind::IOFailure, "downloaded file is missing: " + local_file);
    }

    const std::string file_name = fs::path(local_file).filename().string();

    ActionCommand command;
    if (HasArchiveExtension(file_name)) {
        command = ActionCommand::Unzip(local_file, extensions_dir_);
    } else {
        const std::string target = (fs::path(extensions_dir_) / file_name).string();
        if (!overwrite && fs::exists(target, ec)) {
            return Result::Fail(ErrorKind::IOFailure, "refusing to overwrite " + target);
        }
        command = ActionCommand::Copy(local_file, target);
    }

    auto res = actions.AppendAll({command, ActionCommand::Delete(local_file)});
    if (!res.is_ok()) return res;

    LogInfo("Extension %s scheduled for installation into %s",
            display_name.c_str(), extensions_dir_.c_str());
    return Result::Ok();
}

} // namespace extupd
