// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cfgtree_config.h
/// @brief Compile-time settings for cfgtree and the libraries it builds on.
///
/// Covers:
///   - immer: persistent containers backing Value, ChangeMap and session state
///   - lager: the per-document session store
///   - zug:   transducers pulled in by lager
///
/// Every public cfgtree header includes this file first, so the settings below
/// are seen before any immer/lager/zug header.
///
/// @warning Including immer directly before any cfgtree header is an error.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(CFGTREE_CONFIGURED)
#error "immer headers were included before cfgtree/cfgtree_config.h. " \
       "Include cfgtree headers before any direct immer includes."
#endif

#define CFGTREE_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

// Thread safety stays ON. Independent documents may be diffed on worker
// threads and their trees share structure with the caller's copies, so
// reference counts must be atomic. Do not define IMMER_NO_THREAD_SAFETY.
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "cfgtree requires thread-safe immer reference counting"
#endif

/// @brief Drop node type tags (smaller nodes, no tag assertions)
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

/// @brief Container misuse is a programming error, not a recoverable state
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Lager Settings
// ============================================================

/// @brief Skip compile-time dependency validation in lager::deps.
///
/// Sessions are created without dependencies; the checks only cost
/// compile time.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Settings
// ============================================================

/// @brief Use std::variant inside zug instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Route access failures, skipped paths and patch fallbacks to stderr.
///
/// Defaults to on in debug builds and off when NDEBUG is set.
/// Override with -DCFGTREE_VERBOSE_LOG=0 or =1.
#ifndef CFGTREE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define CFGTREE_VERBOSE_LOG 0
#  else
#    define CFGTREE_VERBOSE_LOG 1
#  endif
#endif

#ifdef CFGTREE_CONFIG_VERBOSE
#pragma message("cfgtree: immer thread safety ENABLED")
#if CFGTREE_VERBOSE_LOG
#pragma message("cfgtree: verbose logging ENABLED")
#endif
#endif
