#pragma once

#include "update/action_script.hpp"
#include "update/descriptor.hpp"
#include "update/extension_installer.hpp"
#include "update/extension_registry.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace extupd {

class InstallStager {
  public:
    InstallStager(IActionLog& action_log, IExtensionInstaller& installer, IExtensionRegistry& registry);

    // Queues removal of the superseded files (if any), installs local_file
    // and records the extension as updated for this session. leftover_dir is
    // removed after everything else. The commands reach the action log in one
    // append, so a failure records none of them.
    Result Stage(const std::optional<std::string>& deferred_delete_path,
                 const std::string& local_file,
                 const std::string& display_name,
                 const ExtensionDescriptor& descriptor,
                 const std::optional<std::string>& leftover_dir = std::nullopt);

  private:
    IActionLog& action_log_;
    IExtensionInstaller& installer_;
    IExtensionRegistry& registry_;
};

} // namespace extupd
