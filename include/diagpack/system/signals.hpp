#pragma once

#include <atomic>

namespace diagpack {

// Set by SIGINT/SIGTERM; the front-end forwards it to RunContext::RequestCancel().
extern std::atomic_bool g_cancel;
// Number of the last cancelling signal, 0 if none arrived.
extern std::atomic_int g_cancel_signal;

// A second signal after the first one terminates the process at once.
void InstallSignalHandlers();

} // namespace diagpack
