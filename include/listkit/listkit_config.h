// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file listkit_config.h
/// @brief Centralized configuration for listkit and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by listkit:
///   - immer: persistent containers backing Snapshot / HierarchicalSnapshot
///   - lager: the store holding the scheduler's committed state
///   - zug:   pulled in by lager
///   - boost: Boost.Asio thread pool for background diffing
///
/// It MUST be included before any library headers. All listkit public headers
/// include it first.

#pragma once

#include <cassert>
#include <cstddef>

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LISTKIT_CONFIGURED)
#error "immer headers were included before listkit/listkit_config.h. " \
       "Please include listkit headers before any direct immer includes."
#endif

#define LISTKIT_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep immer's atomic reference counting.
///
/// Snapshots are handed from the apply context to background diff workers,
/// so structure shared between threads must use atomic refcounts.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

#if IMMER_NO_THREAD_SAFETY
#error "listkit requires IMMER_NO_THREAD_SAFETY=0: snapshots cross threads"
#endif

/// @brief Disable tagged node assertions (smaller nodes)
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

// ============================================================
// Lager / Zug Settings
// ============================================================

#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC). Asio is used header-only.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// listkit Switches
// ============================================================

/// @brief Debug-only duplicate identity checks in Snapshot / HierarchicalSnapshot
///
/// These checks are best-effort: the cross-section check only runs when the
/// snapshot's reverse index is already built.
#ifndef LISTKIT_ENABLE_DUPLICATE_CHECKS
#ifdef NDEBUG
#define LISTKIT_ENABLE_DUPLICATE_CHECKS 0
#else
#define LISTKIT_ENABLE_DUPLICATE_CHECKS 1
#endif
#endif

/// @brief Combined item count (old + new) above which a diff is computed on a
/// background worker instead of inline on the apply context.
#ifndef LISTKIT_DEFAULT_BACKGROUND_THRESHOLD
#define LISTKIT_DEFAULT_BACKGROUND_THRESHOLD 2048
#endif

#if LISTKIT_ENABLE_DUPLICATE_CHECKS
#define LISTKIT_ASSERT(cond, msg) assert((cond) && msg)
#else
#define LISTKIT_ASSERT(cond, msg) ((void)0)
#endif

namespace listkit {

inline constexpr std::size_t default_background_threshold = LISTKIT_DEFAULT_BACKGROUND_THRESHOLD;

} // namespace listkit
