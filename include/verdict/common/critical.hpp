#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace verdict::common {

/// Log and terminate. Reserved for broken infrastructure (storage, codecs on
/// internally produced data); request-level failures never end up here.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace verdict::common
