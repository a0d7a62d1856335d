#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace xdrls::utils {

// Logs "<operation> completed (<duration>)" at debug level when destroyed
class ScopedTimer {
 public:
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer(ScopedTimer&&) = delete;
  auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;
  auto operator=(ScopedTimer&&) -> ScopedTimer& = delete;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  // "123ms" below one second, "1.2s" above
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace xdrls::utils
