#pragma once

#include <labeled-core/misuse-handler.hh>

#include <utility>

namespace test
{
struct misuse_reported
{
};

/// true if f() fails a misuse check
/// the handler throws so that the test can continue instead of aborting
template <class F>
bool reports_misuse(F&& f)
{
    bool fired = false;
    auto handler = lc::impl::scoped_misuse_handler(
        [&](lc::impl::misuse_report const&)
        {
            fired = true;
            throw misuse_reported{};
        });

    try
    {
        std::forward<F>(f)();
    }
    catch (misuse_reported const&) // NOLINT(bugprone-empty-catch)
    {
    }

    return fired;
}
} // namespace test
