// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging for access and definition errors.
///
/// When OPTICS_EXT_VERBOSE_LOG is enabled, failed structural accesses and
/// definition errors are reported to stderr as
///   [func] message (called from file:line)
/// before the lenient accessor returns null or the optic operation throws.
///
/// By default, verbose logging is DISABLED in release builds
/// and ENABLED in debug builds.
///
/// To explicitly enable: #define OPTICS_EXT_VERBOSE_LOG 1
/// To explicitly disable: #define OPTICS_EXT_VERBOSE_LOG 0

#pragma once

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

#ifndef OPTICS_EXT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OPTICS_EXT_VERBOSE_LOG 0
#  else
#    define OPTICS_EXT_VERBOSE_LOG 1
#  endif
#endif

namespace optics_ext {
namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPTICS_EXT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPTICS_EXT_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPTICS_EXT_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_definition_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPTICS_EXT_VERBOSE_LOG
    std::cerr << "[" << func << "] definition error: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail
} // namespace optics_ext
