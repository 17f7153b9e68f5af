#pragma once

// Included by every container header, so it only pulls in <source_location> and <string_view>.
#include <labeled-core/macros.hh>

#include <source_location>
#include <string_view>

// =========================================================================================================
// Misuse checks
// =========================================================================================================
//
// labeled-core separates three kinds of errors:
//   - labeled failures  domain errors, carried as data in lc::outcome and routed by its combinators
//   - static checks     misuse visible in the types (unknown labels, missing handlers, incomplete tables)
//   - misuse checks     misuse that only shows at runtime (reading an inactive slot, bad generator weights)
//
// This header is about the last kind:
//
//   LC_ASSERT(cond, "message")                       checked when LC_ASSERT_ENABLED
//   LC_ASSERT_ALWAYS(cond, "message")                checked in every configuration
//   LC_ASSERT_SLOT(cond, "message", active_label)    like LC_ASSERT, the report names the slot that was active
//
// A failed check builds an lc::impl::misuse_report and hands it to the topmost handler
// (see misuse-handler.hh), or prints it to stderr when no handler is installed.
// If the handler returns, the process breaks into an attached debugger and aborts.
// Handlers may throw instead, which is how the tests observe misuse.
//
// Never check user input with these: a failed check ends the process.
//
// Usage:
//   LC_ASSERT(total > 0, "at least one generator weight must be positive");
//   LC_ASSERT_SLOT(has_value(), "outcome does not hold a success value", active_label());
//

namespace lc
{
using source_location = std::source_location;
}

#define LC_ASSERT(cond, msg) LC_IMPL_CHECK(LC_ASSERT_ENABLED, cond, msg, std::string_view())
#define LC_ASSERT_ALWAYS(cond, msg) LC_IMPL_CHECK(1, cond, msg, std::string_view())
#define LC_ASSERT_SLOT(cond, msg, active) LC_IMPL_CHECK(LC_ASSERT_ENABLED, cond, msg, active)

// LC_DEBUG_BREAK() stops an attached debugger at the call site, otherwise does nothing
#define LC_DEBUG_BREAK() LC_IMPL_DEBUG_BREAK()


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lc::impl
{
// dispatches a failed check to the topmost misuse handler (or stderr), returns if the handler does
LC_COLD_FUNC void report_misuse(char const* expression, char const* message, std::string_view active_slot, lc::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace lc::impl

// the break has to happen inside the macro so the debugger stops at the failing check
#ifdef LC_COMPILER_MSVC
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// SIGTRAP, declared here to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

// disabled checks still type-check their arguments
#define LC_IMPL_CHECK(enabled, cond, msg, active)                                                        \
    do                                                                                                   \
    {                                                                                                    \
        if constexpr (enabled)                                                                           \
        {                                                                                                \
            if (!(cond)) [[unlikely]]                                                                    \
            {                                                                                            \
                ::lc::impl::report_misuse(#cond, msg, active, ::lc::source_location::current());         \
                LC_DEBUG_BREAK();                                                                        \
                ::lc::impl::perform_abort();                                                             \
            }                                                                                            \
        }                                                                                                \
        else                                                                                             \
        {                                                                                                \
            LC_UNUSED(cond);                                                                             \
            LC_UNUSED(msg);                                                                              \
            LC_UNUSED(active);                                                                           \
        }                                                                                                \
    } while (false)
