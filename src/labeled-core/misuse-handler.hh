#pragma once

#include <labeled-core/assert.hh>

#include <functional>
#include <string>

// =========================================================================================================
// Misuse handlers
// =========================================================================================================
//
// Failed misuse checks (LC_ASSERT and friends) are reported to the topmost handler of a global stack.
// Without a handler the report is printed to stderr.
// A handler that returns lets the check abort, a handler that throws unwinds to its catch site.
//
// The handler stack is global state and must be externally synchronized.
//
// Usage:
//   {
//       auto handler = lc::impl::scoped_misuse_handler([](lc::impl::misuse_report const& r) {
//           log_error(lc::impl::describe(r));
//           throw misuse_exception{r.message};
//       });
//
//       auto v = maybe_failed.value(); // a failed outcome reports active_slot == "not_found"
//   } // handler is popped here, also during unwinding
//

namespace lc::impl
{
struct misuse_report
{
    std::string expression;
    std::string message;

    /// the label that was active when an inactive slot was read ("_" for success), empty for other checks
    std::string active_slot;

    lc::source_location location;
};

/// the text printed to stderr when no handler is installed, one line per field
[[nodiscard]] std::string describe(misuse_report const& report);

void push_misuse_handler(std::move_only_function<void(misuse_report const&)> handler);

// NOTE: prefer scoped_misuse_handler so a throwing handler cannot unbalance the stack
void pop_misuse_handler();

struct scoped_misuse_handler
{
    explicit scoped_misuse_handler(std::move_only_function<void(misuse_report const&)> handler);
    ~scoped_misuse_handler();

    scoped_misuse_handler(scoped_misuse_handler const&) = delete;
    scoped_misuse_handler& operator=(scoped_misuse_handler const&) = delete;
    scoped_misuse_handler(scoped_misuse_handler&&) = delete;
    scoped_misuse_handler& operator=(scoped_misuse_handler&&) = delete;
};
} // namespace lc::impl
