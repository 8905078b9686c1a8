#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: VD_COMPILER_MSVC, VD_COMPILER_CLANG, VD_COMPILER_GCC, VD_COMPILER_POSIX

#if defined(_MSC_VER)
#define VD_COMPILER_MSVC
#elif defined(__clang__)
#define VD_COMPILER_CLANG
#elif defined(__GNUC__)
#define VD_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(VD_COMPILER_CLANG) || defined(VD_COMPILER_GCC)
#define VD_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: VD_HAS_CPP_EXCEPTIONS
// From CMake: VD_DEBUG, VD_RELEASE, VD_RELWITHDEBINFO, VD_ENABLE_ASSERT_IN_RELEASE

#ifdef VD_COMPILER_MSVC
#ifdef _CPPUNWIND
#define VD_HAS_CPP_EXCEPTIONS
#endif
#elif defined(VD_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define VD_HAS_CPP_EXCEPTIONS
#endif
#elif defined(VD_COMPILER_GCC)
#if __EXCEPTIONS
#define VD_HAS_CPP_EXCEPTIONS
#endif
#endif

// VD_ASSERT_ENABLED - 1 if VD_ASSERT is checked in this translation unit
// Debug and release-with-debug-info builds always check, release builds only on request
#if defined(VD_DEBUG) || defined(VD_RELWITHDEBINFO) || defined(VD_ENABLE_ASSERT_IN_RELEASE)
#define VD_ASSERT_ENABLED 1
#else
#define VD_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: VD_OS_LINUX (only needed for debugger detection so far)

#if defined(__linux__)
#define VD_OS_LINUX
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// VD_FORCE_INLINE - Force function to be inlined
#define VD_FORCE_INLINE VD_IMPL_FORCE_INLINE

// VD_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: VD_COLD_FUNC void handle_error() { ... }
#define VD_COLD_FUNC VD_IMPL_COLD_FUNC

// VD_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define VD_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(VD_COMPILER_MSVC)

#define VD_IMPL_FORCE_INLINE __forceinline
#define VD_IMPL_COLD_FUNC

#elif defined(VD_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define VD_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define VD_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
