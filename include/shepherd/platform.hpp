#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define SHEPHERD_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define SHEPHERD_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define SHEPHERD_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define SHEPHERD_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || SHEPHERD_PLATFORM_MACOS || SHEPHERD_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define SHEPHERD_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define SHEPHERD_PLATFORM_POSIX 0
#endif

#if !SHEPHERD_PLATFORM_POSIX
#error "shepherd supervises processes through POSIX pipes and signals"
#endif

#if __cplusplus < 202002L
#error "shepherd requires at least C++20"
#endif
