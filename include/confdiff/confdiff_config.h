// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file confdiff_config.h
/// @brief Centralized compile-time configuration for confdiff and immer.
///
/// Every public confdiff header includes this file first, so the immer
/// settings below are seen before any immer header. Users who only include
/// confdiff headers don't need to define anything themselves.
///
/// @warning Do NOT include immer headers before this file.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(CONFDIFF_CONFIGURED)
#error "immer headers were included before confdiff/confdiff_config.h. " \
       "Please include confdiff headers before any direct immer includes."
#endif

#define CONFDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Trees are request-scoped, but requests run on many threads at once and
// immer's heap free lists are shared by the whole process. Thread safety
// must stay enabled.
// ============================================================

#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "confdiff needs immer's thread-safe memory policy; do not set IMMER_NO_THREAD_SAFETY."
#endif

#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Comparison Limits
// ============================================================

/// @brief Default nesting limit for parsing and diffing.
///
/// Recursion depth equals document nesting depth. Adapters reject deeper
/// documents with a ParseError and the differ refuses to descend further.
/// Override per request with ParseOptions::max_depth / CompareOptions::max_depth.
#ifndef CONFDIFF_DEFAULT_MAX_DEPTH
#define CONFDIFF_DEFAULT_MAX_DEPTH 512
#endif

/// @brief Default node budget for YAML documents after alias expansion.
///
/// Aliases are shared in the tree, but the differ, annotator and JSON
/// output all walk the expanded form. Override with ParseOptions::max_nodes.
#ifndef CONFDIFF_DEFAULT_MAX_NODES
#define CONFDIFF_DEFAULT_MAX_NODES 1000000
#endif

// ============================================================
// Verbose Logging
//
// When CONFDIFF_VERBOSE_LOG is non-zero the library reports parse
// failures, depth-limit hits and skipped keys on stderr (see log.h).
// Disabled by default in release builds.
// ============================================================

#ifndef CONFDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define CONFDIFF_VERBOSE_LOG 0
#  else
#    define CONFDIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef CONFDIFF_CONFIG_VERBOSE
#pragma message("confdiff: immer default memory policy (thread-safe)")
#endif
