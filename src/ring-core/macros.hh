#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: RC_COMPILER_MSVC, RC_COMPILER_CLANG, RC_COMPILER_GCC, RC_COMPILER_POSIX

#if defined(_MSC_VER)
#define RC_COMPILER_MSVC
#elif defined(__clang__)
#define RC_COMPILER_CLANG
#elif defined(__GNUC__)
#define RC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(RC_COMPILER_CLANG) || defined(RC_COMPILER_GCC)
#define RC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: RC_OS_WINDOWS, RC_OS_LINUX, RC_OS_APPLE, RC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define RC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define RC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define RC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define RC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: RC_DEBUG, RC_RELEASE, RC_RELWITHDEBINFO, optionally RC_ENABLE_ASSERT_IN_RELEASE
// Derived:    RC_ASSERT_ENABLED (0 or 1)

#ifndef RC_ASSERT_ENABLED
#if defined(RC_DEBUG) || defined(RC_RELWITHDEBINFO) || defined(RC_ENABLE_ASSERT_IN_RELEASE)
#define RC_ASSERT_ENABLED 1
#elif defined(RC_RELEASE)
#define RC_ASSERT_ENABLED 0
#else
// no configuration from the build system (e.g. a consumer including the headers directly): assertions stay on
#define RC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// RC_FORCE_INLINE - Force function to be inlined
#define RC_FORCE_INLINE RC_IMPL_FORCE_INLINE

// RC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: RC_COLD_FUNC void handle_error() { ... }
#define RC_COLD_FUNC RC_IMPL_COLD_FUNC

// RC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: RC_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define RC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(RC_COMPILER_MSVC)

#define RC_IMPL_FORCE_INLINE __forceinline
#define RC_IMPL_COLD_FUNC

#elif defined(RC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define RC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define RC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
