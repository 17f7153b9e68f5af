#include <labeled-core/assert.hh>
#include <labeled-core/failures.hh>
#include <labeled-core/misuse-handler.hh>
#include <labeled-core/outcome.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

#include "assertion-helper.hh"

namespace
{
// collects every report and throws to continue the test
struct report_log
{
    std::vector<lc::impl::misuse_report> reports;

    template <class F>
    void run(F&& f)
    {
        auto handler = lc::impl::scoped_misuse_handler(
            [this](lc::impl::misuse_report const& r)
            {
                reports.push_back(r);
                throw test::misuse_reported{};
            });
        try
        {
            f();
        }
        catch (test::misuse_reported const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }
};
} // namespace

TEST("misuse checks - a failed check reports expression, message and location")
{
    std::optional<lc::impl::misuse_report> captured;
    // CAREFUL: brittle wrt. formatting, the check below must stay 11 lines further down
    int const test_line = __LINE__ + 11;

    {
        auto handler = lc::impl::scoped_misuse_handler(
            [&](lc::impl::misuse_report const& r)
            {
                captured = r;
                throw 0; // returning would abort
            });
        try
        {
            LC_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");
    CHECK(captured->active_slot.empty());

    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("misuse checks - passing checks stay silent")
{
    bool handler_called = false;

    {
        auto handler = lc::impl::scoped_misuse_handler([&](lc::impl::misuse_report const&) { handler_called = true; });
        LC_ASSERT_ALWAYS(true, "never reported");
        LC_ASSERT(2 > 1, "never reported either");
        LC_ASSERT_SLOT(true, "not this one", "_");
    }

    CHECK(!handler_called);
}

TEST("misuse checks - handlers form a stack")
{
    std::vector<std::string> seen;

    auto outer = lc::impl::scoped_misuse_handler(
        [&](lc::impl::misuse_report const& r)
        {
            seen.push_back("outer: " + r.message);
            throw 0;
        });

    try
    {
        auto inner = lc::impl::scoped_misuse_handler(
            [&](lc::impl::misuse_report const& r)
            {
                seen.push_back("inner: " + r.message);
                throw test::misuse_reported{};
            });

        LC_ASSERT_ALWAYS(false, "first");
        CHECK(false); // unreachable
    }
    catch (test::misuse_reported const&) // NOLINT(bugprone-empty-catch)
    {
    }

    // inner was popped during unwinding
    try
    {
        LC_ASSERT_ALWAYS(false, "second");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "inner: first");
    CHECK(seen[1] == "outer: second");
}

TEST("misuse checks - slot access reports the active label")
{
    using O = lc::outcome<int, lc::label<"missing", lc::unit>, lc::label<"invalid", std::string>>;

    report_log log;
    O const failed = lc::failure<"invalid">(std::string("not a number"));
    O const succeeded = 4;

    log.run([&] { (void)failed.value(); });
    log.run([&] { (void)failed.payload<"missing">(); });
    log.run([&] { (void)succeeded.payload<"invalid">(); });

    REQUIRE(log.reports.size() == 3);
    CHECK(log.reports[0].message == "outcome does not hold a success value");
    CHECK(log.reports[0].active_slot == "invalid");
    CHECK(log.reports[1].message == "requested payload of an inactive failure label");
    CHECK(log.reports[1].active_slot == "invalid");
    CHECK(log.reports[2].active_slot == "_");

    // correct access stays silent
    log.run([&] { CHECK(failed.payload<"invalid">() == "not a number"); });
    CHECK(log.reports.size() == 3);
}

TEST("misuse checks - failures report the active label")
{
    using F = lc::failures<lc::label<"timeout", int>, lc::label<"refused", lc::unit>>;

    report_log log;
    F const f = lc::failure<"refused">();
    log.run([&] { (void)f.payload<"timeout">(); });

    REQUIRE(log.reports.size() == 1);
    CHECK(log.reports[0].active_slot == "refused");
}

TEST("misuse checks - describe")
{
    report_log log;
    lc::outcome<int, lc::label<"missing", lc::unit>> const o = lc::failure<"missing">();
    log.run([&] { (void)o.value(); });
    REQUIRE(log.reports.size() == 1);

    auto const text = lc::impl::describe(log.reports[0]);
    CHECK(text.starts_with("labeled-core misuse: outcome does not hold a success value\n"));
    CHECK(text.find("active:   \"missing\"") != std::string::npos);
    CHECK(text.find("has_value()") != std::string::npos);
    CHECK(text.find("outcome.hh") != std::string::npos);

    lc::impl::misuse_report plain;
    plain.expression = "w >= 0";
    plain.message = "generator weights must not be negative";
    CHECK(lc::impl::describe(plain).find("active:") == std::string::npos);
}
