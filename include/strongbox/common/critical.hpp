#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace strongbox::common {

/// Log, flush every sink and terminate. Reserved for faults the ledger cannot
/// represent as a business failure (an unusable or corrupt database).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace strongbox::common
