// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deepeq_config.h
/// @brief Centralized compile-time configuration for deepeq and immer
///
/// This file defines the compile-time configuration for:
///   - immer: Immutable containers backing Value vectors and maps
///   - deepeq: Logging and registry locking toggles
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All deepeq public headers already include this file, so users who only
/// use deepeq headers don't need to do anything special.
///
/// Unlike a single-threaded state container, comparison graphs are routinely
/// shared by test threads that compare against the same expected fixtures,
/// so immer keeps its thread-safe reference counting here.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DEEPEQ_CONFIGURED)
#error "immer headers were included before deepeq/deepeq_config.h. " \
       "Please include deepeq headers before any direct immer includes."
#endif

#define DEEPEQ_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting (values may cross threads)
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Verbose Logging
//
// When DEEPEQ_VERBOSE_LOG is non-zero:
//   - missing-field reads and malformed accesses are reported on stderr
//   - the comparison engine traces cycle cut-offs and comparator matches
//
// By default, verbose logging is DISABLED in release builds
// and ENABLED in debug builds.
// ============================================================

#ifndef DEEPEQ_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DEEPEQ_VERBOSE_LOG 0
#  else
#    define DEEPEQ_VERBOSE_LOG 1
#  endif
#endif

/// @brief Trace every comparator resolution (very noisy, off by default)
#ifndef DEEPEQ_TRACE_RESOLUTION
#define DEEPEQ_TRACE_RESOLUTION 0
#endif

// ============================================================
// Feature Toggle: Registry Locking
// ============================================================

/// @brief Guard ComparatorRegistry with a reader/writer lock
///
/// When enabled (default), registration takes an exclusive lock and
/// lookups take a shared lock, so comparators may be registered while
/// other threads are comparing. Disable only when every registration
/// happens before any comparison starts.
#ifndef DEEPEQ_THREAD_SAFE_REGISTRY
#define DEEPEQ_THREAD_SAFE_REGISTRY 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DEEPEQ_CONFIG_VERBOSE
#if DEEPEQ_THREAD_SAFE_REGISTRY
#pragma message("deepeq: registry locking ENABLED")
#else
#pragma message("deepeq: registry locking DISABLED")
#endif

#if DEEPEQ_VERBOSE_LOG
#pragma message("deepeq: verbose logging ENABLED")
#endif
#endif // DEEPEQ_CONFIG_VERBOSE
