#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: OC_COMPILER_MSVC, OC_COMPILER_CLANG, OC_COMPILER_GCC, OC_COMPILER_POSIX

#if defined(_MSC_VER)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#else
#error "Unsupported compiler"
#endif

#if defined(OC_COMPILER_CLANG) || defined(OC_COMPILER_GCC)
#define OC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: OC_HAS_CPP_EXCEPTIONS
// From CMake: OC_DEBUG, OC_RELEASE, OC_RELWITHDEBINFO, OC_ASSERT_ENABLED

#ifdef OC_COMPILER_MSVC
#ifdef _CPPUNWIND
#define OC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(OC_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define OC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(OC_COMPILER_GCC)
#if __EXCEPTIONS
#define OC_HAS_CPP_EXCEPTIONS
#endif
#endif

// the throwing container APIs (insert, reserve, at, ...) need exceptions
#ifndef OC_HAS_CPP_EXCEPTIONS
#error "ordered-core requires C++ exceptions"
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: OC_OS_WINDOWS, OC_OS_LINUX, OC_OS_APPLE, OC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define OC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define OC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define OC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// OC_FORCE_INLINE - Force function to be inlined
#define OC_FORCE_INLINE OC_IMPL_FORCE_INLINE

// OC_COLD_FUNC - Mark function as rarely executed (error paths, growth, assertions)
// Usage: OC_COLD_FUNC void grow_storage() { ... }
#define OC_COLD_FUNC OC_IMPL_COLD_FUNC

// OC_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
// Usage: default: OC_BUILTIN_UNREACHABLE;
#define OC_BUILTIN_UNREACHABLE OC_IMPL_BUILTIN_UNREACHABLE

// OC_MACRO_JOIN(a, b) - Concatenate two tokens after expanding both
#define OC_MACRO_JOIN(arg1, arg2) OC_IMPL_MACRO_JOIN(arg1, arg2)

// OC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define OC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(OC_COMPILER_MSVC)

#define OC_IMPL_FORCE_INLINE __forceinline
#define OC_IMPL_COLD_FUNC
#define OC_IMPL_BUILTIN_UNREACHABLE __assume(0)

#elif defined(OC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define OC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define OC_IMPL_COLD_FUNC __attribute__((cold))
#define OC_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#endif

#define OC_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
