#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace stakehist::common {

/// Report an unrecoverable invariant violation and stop the process.
///
/// Used for broken external data and backend failures that leave no sane way
/// to continue. Never returns and cannot be caught.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace stakehist::common
