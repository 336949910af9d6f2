#pragma once

/// @file platform.hpp
/// @brief Platform, libc and standard feature detection macros.

#include <version>

#if defined(__has_include)
#if __has_include(<features.h>)
#include <features.h>
#endif
#endif

// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define LAUNCHPAD_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define LAUNCHPAD_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define LAUNCHPAD_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define LAUNCHPAD_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || LAUNCHPAD_PLATFORM_MACOS || LAUNCHPAD_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define LAUNCHPAD_PLATFORM_POSIX 1
#else
#error "launchpad requires a POSIX platform"
#endif

#if LAUNCHPAD_PLATFORM_MACOS
/// @brief True when posix_spawn can change the child's working directory.
#define LAUNCHPAD_HAS_SPAWN_CHDIR 1
#elif defined(__GLIBC__) && defined(__GLIBC_PREREQ)
#if __GLIBC_PREREQ(2, 29)
/// @brief True when posix_spawn can change the child's working directory.
#define LAUNCHPAD_HAS_SPAWN_CHDIR 1
#else
/// @brief True when posix_spawn can change the child's working directory.
#define LAUNCHPAD_HAS_SPAWN_CHDIR 0
#endif
#else
/// @brief True when posix_spawn can change the child's working directory.
#define LAUNCHPAD_HAS_SPAWN_CHDIR 0
#endif

#if LAUNCHPAD_PLATFORM_LINUX && defined(__GLIBC__) && defined(__GLIBC_PREREQ)
#if __GLIBC_PREREQ(2, 34)
/// @brief True when close_range() and posix_spawn_file_actions_addclosefrom_np() exist.
#define LAUNCHPAD_HAS_CLOSE_RANGE 1
#else
/// @brief True when close_range() and posix_spawn_file_actions_addclosefrom_np() exist.
#define LAUNCHPAD_HAS_CLOSE_RANGE 0
#endif
#else
/// @brief True when close_range() and posix_spawn_file_actions_addclosefrom_np() exist.
#define LAUNCHPAD_HAS_CLOSE_RANGE 0
#endif

#if __cplusplus < 202002L
#error "launchpad requires at least C++20"
#endif

#if defined(__cpp_lib_span) && (__cpp_lib_span >= 202002L)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when std::span is available.
#define LAUNCHPAD_HAS_STD_SPAN 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when std::span is available.
#define LAUNCHPAD_HAS_STD_SPAN 0
#endif
