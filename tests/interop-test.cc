#include <labeled-core/interop.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
using div_by_zero = lc::label<"div_by_zero", lc::unit>;

lc::outcome<int, div_by_zero> divide(int a, int b)
{
    if (b == 0)
        return lc::failure<"div_by_zero">();
    return lc::success(a / b);
}

lc::result<int, std::string> parse_port(std::string const& text)
{
    if (text.empty() || text.size() > 5)
        return lc::error(std::string("invalid port: ") + text);
    int port = 0;
    for (auto c : text)
    {
        if (c < '0' || c > '9')
            return lc::error(std::string("invalid port: ") + text);
        port = port * 10 + (c - '0');
    }
    return port;
}

lc::optional<std::string> lookup_host(std::string const& name)
{
    if (name == "local")
        return std::string("127.0.0.1");
    return lc::nullopt;
}

using endpoint_outcome = lc::outcome<int, lc::label<"bad_port", std::string>, lc::label<"unknown_host", std::string>>;

endpoint_outcome resolve_endpoint(std::string const& host, std::string const& port)
{
    // both single-label outcomes widen into endpoint_outcome
    auto const address = lc::note_absence<"unknown_host">(host, lookup_host(host));
    if (!address.has_value())
        return address.map([](std::string const& a) { return int(a.size()); });
    return lc::from_result<"bad_port">(parse_port(port));
}
} // namespace

TEST("interop - division by zero")
{
    auto const ok = divide(10, 2);
    REQUIRE(ok.has_value());
    CHECK(ok.value() == 5);

    auto const bad = divide(10, 0);
    CHECK(bad.is<"div_by_zero">());
    CHECK(bad.active_label() == "div_by_zero");
    CHECK(bad.value_or(-1) == -1);
    CHECK(ok.value_or(-1) == 5);
}

TEST("interop - from_result")
{
    SECTION("value becomes success")
    {
        auto const o = lc::from_result<"parse_failed">(parse_port("8080"));
        static_assert(std::is_same_v<decltype(o), lc::outcome<int, lc::label<"parse_failed", std::string>> const>);
        REQUIRE(o.has_value());
        CHECK(o.value() == 8080);
    }

    SECTION("error becomes the named failure")
    {
        auto const o = lc::from_result<"parse_failed">(parse_port("80a"));
        REQUIRE(o.is<"parse_failed">());
        CHECK(o.payload<"parse_failed">() == "invalid port: 80a");
    }

    SECTION("lvalue results are copied")
    {
        auto const r = parse_port("");
        auto const o = lc::from_result<"parse_failed">(r);
        CHECK(o.payload<"parse_failed">() == r.error());
    }

    SECTION("back to a result")
    {
        for (auto const* text : {"443", "x"})
        {
            auto const r = parse_port(text);
            auto const o = lc::from_result<"parse_failed">(r);
            auto const back = o.match([](auto, std::string const& e) -> lc::result<int, std::string> { return lc::error(e); },
                                      [](int v) -> lc::result<int, std::string> { return v; });
            CHECK((back == r));
        }
    }
}

TEST("interop - to_optional")
{
    auto const present = lc::to_optional(divide(9, 3));
    REQUIRE(present.has_value());
    CHECK(present.value() == 3);

    auto const absent = lc::to_optional(divide(9, 0));
    CHECK(!absent.has_value());

    auto const o = divide(8, 4);
    CHECK((lc::to_optional(o) == 2));
}

TEST("interop - note_absence")
{
    SECTION("present values become success")
    {
        auto const o = lc::note_absence<"unknown_host">(std::string("local"), lookup_host("local"));
        REQUIRE(o.has_value());
        CHECK(o.value() == "127.0.0.1");
    }

    SECTION("absence becomes the named failure")
    {
        auto const o = lc::note_absence<"unknown_host">(std::string("remote"), lookup_host("remote"));
        REQUIRE(o.is<"unknown_host">());
        CHECK(o.payload<"unknown_host">() == "remote");
    }

    SECTION("lazy payloads are only built when needed")
    {
        int calls = 0;
        auto const make_payload = [&]
        {
            ++calls;
            return 404;
        };

        auto const found = lc::note_absence_lazy<"not_found">(make_payload, lookup_host("local"));
        CHECK(found.has_value());
        CHECK(calls == 0);

        auto const missing = lc::note_absence_lazy<"not_found">(make_payload, lookup_host("remote"));
        static_assert(std::is_same_v<decltype(missing), lc::outcome<std::string, lc::label<"not_found", int>> const>);
        REQUIRE(missing.is<"not_found">());
        CHECK(missing.payload<"not_found">() == 404);
        CHECK(calls == 1);
    }
}

TEST("interop - widening into a larger outcome")
{
    auto const ok = resolve_endpoint("local", "8080");
    REQUIRE(ok.has_value());
    CHECK(ok.value() == 8080);

    auto const host = resolve_endpoint("remote", "8080");
    REQUIRE(host.is<"unknown_host">());
    CHECK(host.payload<"unknown_host">() == "remote");

    auto const port = resolve_endpoint("local", "http");
    REQUIRE(port.is<"bad_port">());
    CHECK(port.payload<"bad_port">() == "invalid port: http");
}

TEST("interop - extracting with fallbacks")
{
    SECTION("value_or_else only runs on failure")
    {
        int calls = 0;
        auto const fallback = [&]
        {
            ++calls;
            return 0;
        };
        CHECK(divide(6, 3).value_or_else(fallback) == 2);
        CHECK(calls == 0);
        CHECK(divide(6, 0).value_or_else(fallback) == 0);
        CHECK(calls == 1);
    }

    SECTION("failure_or sees the failure")
    {
        auto const describe = [](lc::failures<div_by_zero> const& f) { return std::string(f.active_label()); };
        CHECK(divide(6, 0).failure_or(std::string("none"), describe) == "div_by_zero");
        CHECK(divide(6, 2).failure_or(std::string("none"), describe) == "none");
    }

    SECTION("failure_or_else only builds the fallback on success")
    {
        int calls = 0;
        auto const fallback = [&]
        {
            ++calls;
            return std::string("none");
        };
        auto const describe = [](lc::failures<div_by_zero> const& f) { return std::string(f.active_label()); };

        CHECK(divide(1, 0).failure_or_else(fallback, describe) == "div_by_zero");
        CHECK(calls == 0);
        CHECK(divide(1, 1).failure_or_else(fallback, describe) == "none");
        CHECK(calls == 1);
    }
}

TEST("interop - round trips")
{
    auto const some = lc::to_optional(lc::from_result<"parse_failed">(parse_port("22")));
    CHECK((some == 22));

    auto const none = lc::to_optional(lc::from_result<"parse_failed">(parse_port("ssh")));
    CHECK((none == lc::nullopt));

    using O = lc::outcome<int, lc::label<"missing", std::string>>;
    O const x = lc::success(7);
    auto const noted = lc::note_absence<"missing">(std::string("unused"), lc::to_optional(x));
    CHECK((noted == x));
}
