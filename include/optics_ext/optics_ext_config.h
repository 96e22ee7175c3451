// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics_ext_config.h
/// @brief Centralized configuration for optics_ext and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by optics_ext:
///   - immer: persistent containers behind Value
///   - lager / zug: lens interop (lager_bridge.h)
///   - boost: Hana struct adaptation (hana_struct.h)
///
/// It MUST be included before any library headers so every translation unit
/// sees the same settings. All optics_ext public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OPTICS_EXT_CONFIGURED)
#error "immer headers were included before optics_ext/optics_ext_config.h. " \
       "Please include optics_ext headers before any direct immer includes."
#endif

#define OPTICS_EXT_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Optics evaluation is single-threaded; Value uses non-atomic refcounts.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
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

// ============================================================
// Lager / Zug Settings
// ============================================================

/// @brief Skip lager's store dependency SFINAE checks (faster compilation)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Boost is used header-only (Hana); disable MSVC auto-linking
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// optics_ext Settings
// ============================================================

/// @brief Default depth guard for Recursive optics
///
/// Recursive descent deeper than this raises recursion_depth_error
/// instead of overflowing the call stack. Override per optic with
/// Recursive::with_max_depth().
#ifndef OPTICS_EXT_DEFAULT_MAX_RECURSION_DEPTH
#define OPTICS_EXT_DEFAULT_MAX_RECURSION_DEPTH 1024
#endif

#ifdef OPTICS_EXT_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("optics_ext: immer thread safety DISABLED (single-threaded evaluation)")
#else
#pragma message("optics_ext: immer thread safety ENABLED")
#endif
#endif // OPTICS_EXT_CONFIG_VERBOSE
