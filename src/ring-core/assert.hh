#pragma once

// Lean header with minimal dependencies, included by every ring-core header.
#include <ring-core/macros.hh>

#include <source_location>

namespace rc
{
/// Source code location (file, line, column, function) captured by assertions
using source_location = std::source_location;
} // namespace rc

// =========================================================================================================
// RC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime. On failure the active assertion handler is called
// (see <ring-core/assert-handler.hh>), then the program breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Enabled whenever RC_ASSERT_ENABLED is 1 (debug and release-with-debug-info builds,
//   or release builds with RC_ENABLE_ASSERT_IN_RELEASE).
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In ring-core: dead node handles, reading an empty optional, reading the error of a successful result,
//   and ring invariants that can only break through a bug in the list itself.
//
// What assertions are NOT for:
//   - NOT for out-of-range indices passed to ring_list::remove_index (that returns list_error)
//   - NOT for any other common/expected error condition
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - result<T, E>    -> common/expected error handling
//
// Usage:
//   RC_ASSERT(is_live(h), "node handle refers to a freed slot");
//   RC_ASSERT(self.has_value(), "attempted to access value of empty optional");
//
#define RC_ASSERT(cond, msg) RC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RC_ASSERT_ALWAYS - Always-active assertion
//
// Like RC_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   RC_ASSERT_ALWAYS((*freemap & slot_bit) == 0, "node slot freed twice");
//
#define RC_ASSERT_ALWAYS(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline so the debugger stops at the assertion site and not inside a helper.
//
#define RC_DEBUG_BREAK() RC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define RC_BREAK_AND_ABORT() (RC_DEBUG_BREAK(), ::rc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints to stderr if none is installed
// Note: does not abort, caller must follow with RC_BREAK_AND_ABORT()
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

#ifdef RC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared directly so this header does not pull in <csignal>
extern "C" int raise(int) noexcept;
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RC_IMPL_DEBUG_BREAK() void(0)

#endif

#define RC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            RC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERT(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expression and message still have to compile
#define RC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RC_UNUSED(cond);          \
        RC_UNUSED(msg);           \
    } while (false)

#endif
