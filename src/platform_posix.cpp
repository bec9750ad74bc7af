#if defined(_WIN32)
#error "platform_posix.cpp should not be compiled on Windows builds"
#else

#include "platform.h"

#include <string_view>

namespace cmdex::platform {

platform_id native() { return platform_id::POSIX; }

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

std::string_view arch_name() {
#if defined(__aarch64__) || defined(__arm64__)
  return
#if defined(__APPLE__)
      "arm64";
#else
      "aarch64";
#endif
#elif defined(__x86_64__)
  return "x86_64";
#else
  return "unknown";
#endif
}

}  // namespace cmdex::platform

#endif  // POSIX implementation
