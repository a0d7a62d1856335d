#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <array>
#include <csignal>
#include <exception>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

struct FatalSignal {
  int number;
  const char* name;
};

constexpr std::array kFatalSignals = {
    FatalSignal{.number = SIGSEGV, .name = "SIGSEGV"},
    FatalSignal{.number = SIGFPE, .name = "SIGFPE"},
    FatalSignal{.number = SIGILL, .name = "SIGILL"},
    FatalSignal{.number = SIGBUS, .name = "SIGBUS"},
};

auto SignalName(int sig) -> const char* {
  for (const auto& fatal : kFatalSignals) {
    if (fatal.number == sig) {
      return fatal.name;
    }
  }
  return "unknown";
}

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\nxdrls: fatal signal " << SignalName(sig) << " (" << sig
            << ")\n";

  try {
    std::cerr << std::stacktrace::current() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "stack trace unavailable: " << e.what() << "\n";
  }

  std::cerr.flush();
  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (const auto& fatal : kFatalSignals) {
    std::signal(fatal.number, HandleFatalSignal);
  }
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app
