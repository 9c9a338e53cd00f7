/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for BlueScan
 *
 * This header provides compile-time platform detection and defines
 * the appropriate macros for cross-platform development.
 *
 * BlueScan only supports Linux and Android platforms.
 */

#ifndef BLUESCAN_PLATFORM_H
#define BLUESCAN_PLATFORM_H

// ============================================================================
// Platform Detection (Linux and Android only)
// ============================================================================

#if defined(__ANDROID__)
#define BLUESCAN_PLATFORM_ANDROID 1
#define BLUESCAN_PLATFORM_LINUX 1
#define BLUESCAN_PLATFORM_NAME "Android"
#elif defined(__linux__)
#define BLUESCAN_PLATFORM_LINUX 1
#define BLUESCAN_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. BlueScan only supports Linux and Android."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define BLUESCAN_COMPILER_CLANG 1
#define BLUESCAN_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define BLUESCAN_COMPILER_GCC 1
#define BLUESCAN_COMPILER_NAME "GCC"
#else
#define BLUESCAN_COMPILER_UNKNOWN 1
#define BLUESCAN_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef BLUESCAN_BUILDING_SHARED
#define BLUESCAN_API __attribute__((visibility("default")))
#else
#define BLUESCAN_API
#endif

#define BLUESCAN_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define BLUESCAN_UNUSED(x) (void)(x)

#define BLUESCAN_LIKELY(x) __builtin_expect(!!(x), 1)
#define BLUESCAN_UNLIKELY(x) __builtin_expect(!!(x), 0)

// ============================================================================
// Feature Detection
// ============================================================================

// Radio backend (BlueZ over D-Bus on desktop Linux)
#if defined(BLUESCAN_PLATFORM_LINUX) && !defined(BLUESCAN_PLATFORM_ANDROID)
#ifdef BLUESCAN_HAS_BLUEZ
#define BLUESCAN_RADIO_BLUEZ 1
#endif
#endif

#endif // BLUESCAN_PLATFORM_H
