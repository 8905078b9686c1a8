#pragma once

// Lean header, safe to include from every result header.
#include <verdict/macros.hh>

#include <source_location>

// =========================================================================================================
// VD_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and reports failures through the assertion handler stack
// (see <verdict/assert-handler.hh>), then breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Enabled in VD_DEBUG and VD_RELWITHDEBINFO builds.
//   In VD_RELEASE builds, assertions are disabled unless VD_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Error handling strategy of verdict:
//   - Assertions        -> programmer errors, e.g. reading value() of a failure
//   - Exceptions        -> thrown by user callbacks, propagated by unsafe operations
//   - result<S, F>      -> expected failures, and exceptions caught by the safe operations
//
// Usage:
//   VD_ASSERT(is_success(), "attempted to access value of a failure result");
//   VD_ASSERT(i >= 0 && i < size(), "index out of bounds");
//
#define VD_ASSERT(cond, msg) VD_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// VD_ASSERT_ALWAYS - Always-active assertion
//
// Like VD_ASSERT but remains active in all build configurations, including release builds.
//
#define VD_ASSERT_ALWAYS(cond, msg) VD_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// VD_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define VD_DEBUG_BREAK() VD_IMPL_DEBUG_BREAK()

// =========================================================================================================
// VD_BREAK_AND_ABORT - Debug break followed by program termination
//
#define VD_BREAK_AND_ABORT() (VD_DEBUG_BREAK(), ::vd::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace vd::impl
{
// Called when an assertion fails
// Forwards to the topmost assertion handler, or prints to stderr if there is none
// Note: does not abort, caller must follow with VD_BREAK_AND_ABORT()
VD_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace vd::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef VD_COMPILER_MSVC

#define VD_IMPL_DEBUG_BREAK() (::vd::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(VD_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared by hand so this header does not pull in <csignal>
extern "C" int raise(int) noexcept;
#define VD_IMPL_DEBUG_BREAK() (::vd::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define VD_IMPL_DEBUG_BREAK() void(0)

#endif

#define VD_IMPL_ASSERT_ALWAYS(cond, msg)                                                    \
    do                                                                                      \
    {                                                                                       \
        if (!(cond)) [[unlikely]]                                                           \
        {                                                                                   \
            ::vd::impl::handle_assert_failure(#cond, msg, std::source_location::current()); \
            VD_BREAK_AND_ABORT();                                                           \
        }                                                                                   \
    } while (false)

#if VD_ASSERT_ENABLED

#define VD_IMPL_ASSERT(cond, msg) VD_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expression still has to compile
#define VD_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        VD_UNUSED(cond);          \
        VD_UNUSED(msg);           \
    } while (false)

#endif
