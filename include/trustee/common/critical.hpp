#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace trustee::common {

/// Log an unrecoverable fault and bring the process down.
///
/// Reserved for infrastructure failures (storage I/O, undecodable persisted
/// rows). Operation-level failures are reported through transaction results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace trustee::common
