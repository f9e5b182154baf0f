// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file keydiff_config.h
/// @brief Centralized configuration for keydiff and its dependencies
///
/// This file defines the compile-time configuration for keydiff and for the
/// third-party containers it diffs:
///   - immer: persistent map/set (structural diff fast path)
///   - tsl::robin_map: hashed key union during map walks
///
/// Include keydiff headers before any direct immer include so that the immer
/// settings below are seen consistently; nothing checks this at compile time.
/// All keydiff public headers include this file first.

#pragma once

// ============================================================
// Logging
// ============================================================

/// @brief Diagnostic output on std::cerr (see keydiff/log.h)
///
/// Enabled by default in debug builds, disabled when NDEBUG is set.
/// To force it either way: #define KEYDIFF_VERBOSE_LOG 0 / 1
#ifndef KEYDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define KEYDIFF_VERBOSE_LOG 0
#  else
#    define KEYDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Bucket sizing
// ============================================================

/// @brief Trim threshold for the result buckets
///
/// Buckets are reserved to their upper bound before the key walk. After the
/// walk a bucket whose capacity exceeds size * KEYDIFF_SHRINK_FACTOR is
/// shrunk to fit. Set to 0 to never shrink.
#ifndef KEYDIFF_SHRINK_FACTOR
#define KEYDIFF_SHRINK_FACTOR 2
#endif

// ============================================================
// Feature Toggle: immer containers
// ============================================================

/// @brief Include immer::map / immer::set support from keydiff/keydiff.h
///
/// When enabled (default) keydiff/key_walk.h pulls in keydiff/immer_support.h,
/// which routes immer containers through immer::diff so that structurally
/// shared subtrees are skipped without comparison. Every translation unit of
/// a program must see the same value.
#ifndef KEYDIFF_ENABLE_IMMER
#define KEYDIFF_ENABLE_IMMER 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Single-threaded immer reference counting
///
/// Off by default: independent diffs over shared immer snapshots may run on
/// different threads. Turning it on maps to IMMER_NO_THREAD_SAFETY.
#ifndef KEYDIFF_IMMER_SINGLE_THREADED
#define KEYDIFF_IMMER_SINGLE_THREADED 0
#endif

#if KEYDIFF_IMMER_SINGLE_THREADED && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef KEYDIFF_CONFIG_VERBOSE
#if KEYDIFF_VERBOSE_LOG
#pragma message("keydiff: diagnostic logging ENABLED")
#else
#pragma message("keydiff: diagnostic logging DISABLED")
#endif

#if KEYDIFF_ENABLE_IMMER
#pragma message("keydiff: immer container support ENABLED")
#endif

#if KEYDIFF_IMMER_SINGLE_THREADED
#pragma message("keydiff: immer thread safety DISABLED (single-thread)")
#endif
#endif // KEYDIFF_CONFIG_VERBOSE
