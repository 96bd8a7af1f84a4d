#pragma once

#include <string_view>

#ifndef TERMCTL_PLATFORM_LINUX
#define TERMCTL_PLATFORM_LINUX 0
#endif

namespace termctl::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = TERMCTL_PLATFORM_LINUX != 0;

    inline constexpr auto proc_root = "/proc"sv;

}  // namespace termctl::internal::platform
