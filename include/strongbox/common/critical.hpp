#pragma once

#include <csignal>
#include <exception>
#include <source_location>
#include <string_view>

#include <spdlog/spdlog.h>

namespace strongbox::common {

/// Log a violated ledger invariant with its call site and bring the process
/// down. Nothing is written to storage after this point.
[[noreturn]] inline void critical(
    const std::string_view message,
    const std::source_location location = std::source_location::current()) {
  spdlog::critical("{} ({}:{} in {})", message, location.file_name(),
                   location.line(), location.function_name());
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace strongbox::common
