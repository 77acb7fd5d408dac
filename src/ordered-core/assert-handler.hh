#pragma once

#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

#include <functional>
#include <string>

namespace oc::impl
{
// Customizable assertion handler stack
// NOTE: Handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const& info) {
//           report(info);
//           throw contract_violation{info.message};
//       });
//
//       map[missing_key]; // reported to the handler above instead of aborting
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    oc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point; returning normally still aborts.
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler so throwing handlers are popped during unwinding.
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
} // namespace oc::impl
