// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for object_trans_system
 *
 * Central place for the optional kcenon ecosystem integrations.
 * KCENON_WITH_* flags may be inherited from common_system; otherwise they
 * are derived from the BUILD_WITH_* compile definitions set by CMake when
 * the corresponding package was found.
 *
 * @code
 * #include <kcenon/object_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = std::make_shared<kcenon::thread::thread_pool>("transfers");
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define OBJ_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define OBJ_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for task runners and part uploads)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Whether log records are forwarded to logger_system
 *
 * logger_system needs common_system for its result types.
 */
#ifndef OBJ_TRANS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define OBJ_TRANS_USE_LOGGER_SYSTEM 1
    #else
        #define OBJ_TRANS_USE_LOGGER_SYSTEM 0
    #endif
#endif

#ifdef OBJ_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Object Transfer System Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async fallback)")
#endif

#if OBJ_TRANS_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr fallback)")
#endif

#endif  // OBJ_TRANS_PRINT_FEATURE_SUMMARY
