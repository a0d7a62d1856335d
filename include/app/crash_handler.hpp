#pragma once

namespace app {

/// Prints a std::stacktrace to stderr on SIGSEGV, SIGFPE, SIGILL and SIGBUS,
/// then re-raises the signal with the default action. No-op off Linux.
void InitializeCrashHandlers();

/// Raises SIGSTOP when WAIT_FOR_GDB is set so a debugger can attach before
/// the server starts. No-op off Linux.
void WaitForDebuggerIfRequested();

}  // namespace app
