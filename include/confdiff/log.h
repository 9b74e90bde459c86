// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic helpers writing to stderr.
///
/// All helpers compile to no-ops unless CONFDIFF_VERBOSE_LOG is non-zero
/// (see confdiff_config.h). Output format:
///   [component] message (called from file:line)

#pragma once

#include "confdiff_config.h"

#include <iostream>
#include <source_location>
#include <string_view>

namespace confdiff::detail {

inline void log_message(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFDIFF_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

inline void log_parse_failure(
    std::string_view format,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFDIFF_VERBOSE_LOG
    std::cerr << "[parse:" << format << "] " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)format;
    (void)reason;
    (void)loc;
#endif
}

inline void log_key_skipped(
    std::string_view func,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << path << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

} // namespace confdiff::detail
