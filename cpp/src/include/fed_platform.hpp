#pragma once
/**
 * @file fed_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (FEDERATOR_PLATFORM_LINUX, FEDERATOR_IS_POSIX, ...)
 * includes this header. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_LINUX) && defined(_WIN64))

#define FEDERATOR_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))

#define FEDERATOR_PLATFORM_APPLE 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)

#define FEDERATOR_PLATFORM_LINUX 1

#else

#define FEDERATOR_PLATFORM_UNKNOWN 1

#endif

// Convenience booleans for source code usage:
#if defined(FEDERATOR_PLATFORM_WIN64)
#define FEDERATOR_IS_WINDOWS 1
#elif defined(FEDERATOR_PLATFORM_APPLE) || defined(FEDERATOR_PLATFORM_LINUX)
#define FEDERATOR_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location, concepts and designated initializers are used throughout.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "federator_utils_export.h"

namespace federator::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
FEDERATOR_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
FEDERATOR_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
FEDERATOR_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
FEDERATOR_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, 0 if start_ns is in the future.
 */
FEDERATOR_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace federator::platform
