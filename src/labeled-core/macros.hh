#pragma once

// =========================================================================================================
// Platform detection
// =========================================================================================================
//
// Compiler: exactly one of LC_COMPILER_MSVC, LC_COMPILER_CLANG, LC_COMPILER_GCC
//           LC_COMPILER_POSIX for clang and gcc (this includes mingw, which reports __GNUC__)
// OS:       exactly one of LC_OS_WINDOWS, LC_OS_LINUX, LC_OS_APPLE, LC_OS_BSD
//

#if defined(_MSC_VER) && !defined(__clang__)
#define LC_COMPILER_MSVC
#elif defined(__clang__)
#define LC_COMPILER_CLANG
#define LC_COMPILER_POSIX
#elif defined(__GNUC__)
#define LC_COMPILER_GCC
#define LC_COMPILER_POSIX
#else
#error "labeled-core supports msvc, clang and gcc"
#endif

#if defined(_WIN32)
#define LC_OS_WINDOWS
#elif defined(__APPLE__)
#define LC_OS_APPLE
#elif defined(__linux__)
#define LC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define LC_OS_BSD
#else
#error "labeled-core supports windows, apple, linux and the BSDs"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
//
// The build defines one of LC_DEBUG, LC_RELEASE, LC_RELWITHDEBINFO.
// Misuse checks (LC_ASSERT) run in debug and relwithdebinfo, and in release with LC_ENABLE_ASSERT_IN_RELEASE.
// LC_ASSERT_ENABLED is always 0 or 1.
//

#if defined(LC_DEBUG) || defined(LC_RELWITHDEBINFO) || defined(LC_ENABLE_ASSERT_IN_RELEASE)
#define LC_ASSERT_ENABLED 1
#else
#define LC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Attributes and helpers
// =========================================================================================================

#ifdef LC_COMPILER_MSVC
#define LC_FORCE_INLINE __forceinline
#define LC_COLD_FUNC
#else
// gcc wants the extra inline next to always_inline
#define LC_FORCE_INLINE __attribute__((always_inline)) inline
#define LC_COLD_FUNC __attribute__((cold))
#endif

// LC_UNUSED(expr) type-checks expr without evaluating it
#define LC_UNUSED(expr) (void)(sizeof((expr)))
