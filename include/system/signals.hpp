#pragma once

#include "system/cancel_token.hpp"

namespace extupd {

// Set by SIGINT / SIGTERM once InstallSignalHandlers() ran.
CancelToken& ProcessCancelToken();

void InstallSignalHandlers();

} // namespace extupd
