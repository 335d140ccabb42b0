#pragma once
/**
 * @file fed_base.hpp
 * @brief Layer 1: Basic modules built on fed_platform.
 *
 * Provides format_tools, debug_info, scope_guard and the Result type. Also includes
 * module_def for lifecycle module registration.
 */
#include "fed_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
#include "utils/module_def.hpp"
