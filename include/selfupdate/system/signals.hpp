#pragma once

#include <atomic>
#include <chrono>

namespace selfupdate {

// Set by SIGINT/SIGTERM.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

// Sleeps in short slices until `timeout` elapses or a signal arrives.
// Returns true when cancelled.
bool WaitForCancel(std::chrono::milliseconds timeout);

} // namespace selfupdate
