#pragma once

// Lean header: only macros and source_location, safe to include from every container header.
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

// =========================================================================================================
// OC_ASSERT - Runtime contract check with string literal message
//
// Checks a condition and, on failure, reports through the assertion handler stack,
// breaks into an attached debugger and aborts.
//
// When assertions are active:
//   OC_ASSERT_ENABLED is set by CMake for Debug and RelWithDebInfo builds.
//   Release builds strip OC_ASSERT unless OC_ENABLE_ASSERT_IN_RELEASE is switched on.
//
// Error handling in ordered-core:
//   - OC_ASSERT       -> programmer errors: out-of-range index, operator[] on a missing key,
//                        malformed raw parts, broken container invariants
//   - exceptions      -> oc::error_exception from the throwing APIs (insert, reserve, at, ...)
//   - result<T, E>    -> expected failures: allocation_failure from try_* APIs,
//                        duplicate_key from bulk construction
//
// Never assert on external conditions. An allocator running out of memory is an error, not an assertion.
//
// Usage:
//   OC_ASSERT(idx < size(), "index out of bounds");
//   OC_ASSERT(parts.length <= parts.capacity, "raw parts: length exceeds capacity");
//
#define OC_ASSERT(cond, msg) OC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// OC_ASSERT_ALWAYS - Always-active assertion
//
// Like OC_ASSERT but also checked in release builds.
// Used where continuing would corrupt memory, e.g. a memory resource violating its own contract.
//
#define OC_ASSERT_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// OC_DEBUG_BREAK - Break into the debugger if one is attached, otherwise no-op
//
#define OC_DEBUG_BREAK() OC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// OC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define OC_BREAK_AND_ABORT() (OC_DEBUG_BREAK(), ::oc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace oc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or the default stderr handler)
// Note: does not abort, caller must follow with OC_BREAK_AND_ABORT()
OC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, oc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace oc::impl

// The debugger should break inside the macro expansion, so this cannot hide in a function call

#ifdef OC_COMPILER_MSVC

#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(OC_COMPILER_POSIX)

// SIGTRAP (5) without pulling in <csignal>
extern "C" int raise(int) noexcept;
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define OC_IMPL_DEBUG_BREAK() void(0)

#endif

#define OC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::oc::impl::handle_assert_failure(#cond, msg, ::oc::source_location::current()); \
            OC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if OC_ASSERT_ENABLED

#define OC_IMPL_ASSERT(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg still have to compile
#define OC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OC_UNUSED(cond);          \
        OC_UNUSED(msg);           \
    } while (false)

#endif
