#pragma once

#include <string_view>

// Platform-specific unreachable hint. Use compiler intrinsics where available
// while remaining safe for MSVC which lacks __builtin_unreachable.
#if defined(_MSC_VER)
#define CMDEX_UNREACHABLE() __assume(0)
#else
#define CMDEX_UNREACHABLE() __builtin_unreachable()
#endif

namespace cmdex::platform {

enum class platform_id { POSIX, WINDOWS, UNKNOWN };

platform_id native();

std::string_view os_name();
std::string_view arch_name();

}  // namespace cmdex::platform
