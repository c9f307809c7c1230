// GpuBind Core
// assert.hpp - Always-on contract checks

#pragma once

#include <source_location>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace gpubind::core {

// Logs the violated contract at critical level, echoes it to stderr and aborts.
[[noreturn]] void fatal_error(std::string_view message,
                              std::source_location where = std::source_location::current());

namespace detail {

[[noreturn]] void assert_failed(std::string_view condition, std::string_view message,
                                std::source_location where);

}  // namespace detail

}  // namespace gpubind::core

// Contract checks stay enabled in release builds. The message is an fmt format string.
#define GPUBIND_ASSERT(condition, ...)                                                          \
    do {                                                                                        \
        if (!(condition)) {                                                                     \
            ::gpubind::core::detail::assert_failed(#condition, ::fmt::format(__VA_ARGS__),      \
                                                   ::std::source_location::current());          \
        }                                                                                       \
    } while (false)

#define GPUBIND_FATAL(...) \
    ::gpubind::core::fatal_error(::fmt::format(__VA_ARGS__), ::std::source_location::current())
