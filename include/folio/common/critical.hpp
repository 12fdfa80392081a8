#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace folio::common {

/// Log, flush and terminate. Reserved for states the ledger cannot recover
/// from (corrupt in-memory encoding, uninitialised database handle).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace folio::common
