#pragma once

#include <ring-core/assert.hh>

#include <functional>
#include <string>

namespace rc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       list.value_of(stale_handle); // asserts, handler throws instead of aborting
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler, it also pops when a throwing handler unwinds the scope
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rc::impl
