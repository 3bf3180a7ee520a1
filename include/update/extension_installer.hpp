#pragma once

#include "update/action_script.hpp"
#include "util/result.hpp"

#include <string>

namespace extupd {

class IExtensionInstaller {
  public:
    virtual ~IExtensionInstaller() = default;

    // Registers local_file as the new installed copy of display_name. Deferred
    // work is recorded into actions; nothing is recorded when this fails.
    virtual Result Install(const std::string& local_file,
                           const std::string& display_name,
                           bool overwrite,
                           IActionLog& actions) = 0;
};

// Installs through the action log so the new files land after any deferred
// delete of the old version queued ahead of them: archives are unpacked into
// the extensions directory, raw packages copied there. The downloaded file is
// removed once it has been used.
class ExtensionInstaller final : public IExtensionInstaller {
  public:
    explicit ExtensionInstaller(std::string extensions_dir);

    Result Install(const std::string& local_file,
                   const std::string& display_name,
                   bool overwrite,
                   IActionLog& actions) override;

  private:
    std::string extensions_dir_;
};

} // namespace extupd
