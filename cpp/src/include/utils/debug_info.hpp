/**
 * @file debug_info.hpp
 * @brief Debug messaging that bypasses the Logger.
 *
 * Used by code that runs before the Logger is started or after it has shut down
 * (the Logger itself, the lifecycle manager). Output goes straight to `stderr` and
 * is compiled out unless FEDERATOR_ENABLE_DEBUG_MESSAGES is defined.
 */
#pragma once

#include <cstdio>
#include <fmt/format.h>
#include <source_location>
#include <string>

#include "utils/format_tools.hpp"

namespace federator::debug
{

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt_str.get(), e.what());
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  EXCEPTION DURING DEBUG_MSG: fmt_str['{}'] ({})\n",
                   fmt_str.get(), e.what());
        std::fflush(stderr);
    }
}

} // namespace federator::debug

inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", federator::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

#ifndef FED_DEBUG
#if defined(FEDERATOR_ENABLE_DEBUG_MESSAGES)
#define FED_DEBUG(fmt, ...) ::federator::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define FED_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
