// log.h - Diagnostic logging helpers for keydiff

#pragma once

#include <keydiff/keydiff_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace keydiff {
namespace detail {

// ============================================================
// Diagnostic output
//
// Messages go to std::cerr as "[function] message (called from file:line)".
// Controlled by KEYDIFF_VERBOSE_LOG (see keydiff_config.h).
// ============================================================

inline void log_invariant_violation(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] invariant violated: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_strategy_error(
    std::string_view func,
    std::string_view strategy,
    std::string_view value_type,
    std::source_location loc = std::source_location::current()) noexcept
{
#if KEYDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] strategy '" << strategy << "'";
    if (value_type.empty()) {
        std::cerr << " is unknown";
    } else {
        std::cerr << " is not defined for " << value_type;
    }
    std::cerr << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)strategy;
    (void)value_type;
    (void)loc;
#endif
}

} // namespace detail
} // namespace keydiff
