// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_ivm_config.h
/// @brief Centralized compile-time configuration for json_ivm and its dependencies
///
/// This file defines the settings for the third-party libraries used by json_ivm:
///   - immer: persistent containers backing JSON objects and arrays
///   - lager: lenses used for path-scoped edits
///   - zug: lens composition
///
/// plus the engine defaults (depth limit, vector-lane threshold, logging).
///
/// @warning It MUST be included before any immer/lager header. All json_ivm
///          public headers include it first, so users who only include
///          json_ivm headers don't need to do anything special.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_IVM_CONFIGURED)
#error "immer headers were included before json_ivm/json_ivm_config.h. " \
       "Please include json_ivm headers before any direct immer includes."
#endif

#define JSON_IVM_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// Thread safety stays enabled: documents handed to the engine may be shared
/// by concurrent calls, so reference counts must be atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// Disable tagged node assertions (smaller nodes, no assertion overhead)
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

/// Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Engine Defaults
// ============================================================

/// Maximum nesting depth accepted by recursive merges.
/// Scalars have depth 0, {"a": 1} has depth 1.
#ifndef JSON_IVM_MAX_DEPTH
#define JSON_IVM_MAX_DEPTH 1000
#endif

/// Minimum array length at which integer predicates use the vector-lane search.
#ifndef JSON_IVM_SIMD_THRESHOLD
#define JSON_IVM_SIMD_THRESHOLD 32
#endif

/// Elements compared per lane in the vectorized integer search.
#define JSON_IVM_LANE_WIDTH 8

// ============================================================
// Verbose Logging
//
// When enabled, graceful no-ops (missing field, wrong type, no match,
// unresolved path) are reported to stderr with the caller's location.
// Enabled by default in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef JSON_IVM_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSON_IVM_VERBOSE_LOG 0
#  else
#    define JSON_IVM_VERBOSE_LOG 1
#  endif
#endif
