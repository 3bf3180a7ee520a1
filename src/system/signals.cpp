// signals.cpp - Signal handling and the process-wide cancel token.

#include "system/signals.hpp"

#include <csignal>

namespace extupd {

namespace {
CancelToken g_cancel;
} // namespace

static void HandleSignal(int) {
    g_cancel.Cancel();
}

CancelToken& ProcessCancelToken() { return g_cancel; }

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

} // namespace extupd
