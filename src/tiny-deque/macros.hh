#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: TD_COMPILER_MSVC, TD_COMPILER_CLANG, TD_COMPILER_GCC, TD_COMPILER_MINGW, TD_COMPILER_POSIX

#if defined(_MSC_VER)
#define TD_COMPILER_MSVC
#elif defined(__clang__)
#define TD_COMPILER_CLANG
#elif defined(__GNUC__)
#define TD_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define TD_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(TD_COMPILER_CLANG) || defined(TD_COMPILER_GCC) || defined(TD_COMPILER_MINGW)
#define TD_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: TD_OS_WINDOWS, TD_OS_LINUX, TD_OS_APPLE, TD_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define TD_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define TD_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define TD_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define TD_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: TD_DEBUG, TD_RELEASE, TD_RELWITHDEBINFO, TD_ENABLE_ASSERT_IN_RELEASE, TD_ENABLE_ALLOCATION
// Always defined (0 or 1): TD_ASSERT_ENABLED, TD_HAS_ALLOCATION

// assertions are active in debug and relwithdebinfo builds (and in release on request)
#if defined(TD_DEBUG) || defined(TD_RELWITHDEBINFO) || defined(TD_ENABLE_ASSERT_IN_RELEASE)
#define TD_ASSERT_ENABLED 1
#else
#define TD_ASSERT_ENABLED 0
#endif

// heap storage support (td::allocation, td::memory_resource and tiny_deque migration)
// without it, tiny_deque is inline-only and rejects pushes past its inline capacity
#ifdef TD_ENABLE_ALLOCATION
#define TD_HAS_ALLOCATION 1
#else
#define TD_HAS_ALLOCATION 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// TD_FORCE_INLINE - Force function to be inlined
#define TD_FORCE_INLINE TD_IMPL_FORCE_INLINE

// TD_COLD_FUNC - Mark function as rarely executed (error paths, assertions, migrations)
// Usage: TD_COLD_FUNC void handle_error() { ... }
#define TD_COLD_FUNC TD_IMPL_COLD_FUNC

// TD_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: TD_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define TD_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(TD_COMPILER_MSVC)

#define TD_IMPL_FORCE_INLINE __forceinline
#define TD_IMPL_COLD_FUNC

#elif defined(TD_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define TD_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define TD_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
