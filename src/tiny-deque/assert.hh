#pragma once

// Lean header with minimal dependencies - included by every container header.
#include <tiny-deque/macros.hh>

#include <source_location>

namespace td
{
/// Type alias for std::source_location (file, line, column, function)
using source_location = std::source_location;
} // namespace td

// =========================================================================================================
// TD_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active in debug and release-with-debug-info builds (TD_ASSERT_ENABLED).
//
// Assertions protect INVARIANTS, PRECONDITIONS and POSTCONDITIONS of the deques:
//   - operator[] / front() / back() outside the live range
//   - pop_front() / pop_back() on an empty deque
//   - push_back() / push_front() on a full array_deque
//
// They are NOT the way to handle expected failures. Use the try_* operations instead,
// which report td::deque_error through td::result.
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - result<T, E>    -> common/expected error handling (full deque, empty deque, bad index)
//
// Usage:
//   TD_ASSERT(!full(), "push_back on full array_deque");
//   TD_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define TD_ASSERT(cond, msg) TD_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// TD_ASSERT_ALWAYS - Always-active assertion
//
// Like TD_ASSERT but remains active in all build configurations, including release builds.
// Used for conditions that must never be ignored, e.g. allocation failure in the system resource.
//
#define TD_ASSERT_ALWAYS(cond, msg) TD_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// TD_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define TD_DEBUG_BREAK() TD_IMPL_DEBUG_BREAK()

// =========================================================================================================
// TD_BREAK_AND_ABORT - Debug break followed by program termination
//
#define TD_BREAK_AND_ABORT() (TD_DEBUG_BREAK(), ::td::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace td::impl
{
// Called when an assertion fails
// Dispatches to the topmost custom handler, or prints diagnostics to stderr
// Note: does not abort, caller must follow with TD_BREAK_AND_ABORT()
TD_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, td::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace td::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef TD_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define TD_IMPL_DEBUG_BREAK() (::td::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(TD_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define TD_IMPL_DEBUG_BREAK() (::td::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define TD_IMPL_DEBUG_BREAK() void(0)

#endif

#define TD_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::td::impl::handle_assert_failure(#cond, msg, ::td::source_location::current()); \
            TD_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if TD_ASSERT_ENABLED

#define TD_IMPL_ASSERT(cond, msg) TD_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define TD_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        TD_UNUSED(cond);          \
        TD_UNUSED(msg);           \
    } while (false)

#endif
