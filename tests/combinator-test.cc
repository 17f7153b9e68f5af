#include <labeled-core/outcome.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
using not_found = lc::label<"not_found", std::string>;
using too_large = lc::label<"too_large", int>;
using negative = lc::label<"negative", int>;

using lookup_outcome = lc::outcome<int, not_found, too_large>;
using checked_outcome = lc::outcome<int, not_found, too_large, negative>;

lookup_outcome lookup(std::string const& key)
{
    if (key == "one")
        return 1;
    if (key == "minus")
        return -4;
    if (key == "huge")
        return lc::failure<"too_large">(1 << 20);
    return lc::failure<"not_found">(key);
}

checked_outcome check_positive(int v)
{
    if (v < 0)
        return lc::failure<"negative">(v);
    return v;
}

lookup_outcome halve(int v)
{
    if (v > 1000)
        return lc::failure<"too_large">(v);
    return v / 2;
}

template <class O>
bool same(O const& a, O const& b)
{
    return a == b;
}
} // namespace

TEST("combinators - map")
{
    SECTION("transforms the success value")
    {
        auto const r = lookup("one").map([](int v) { return std::to_string(v * 10); });
        static_assert(std::is_same_v<decltype(r), lc::outcome<std::string, not_found, too_large> const>);
        REQUIRE(r.has_value());
        CHECK(r.value() == "10");
    }

    SECTION("failures pass through unchanged")
    {
        int calls = 0;
        auto const r = lookup("two").map(
            [&](int v)
            {
                ++calls;
                return v + 1;
            });
        CHECK(calls == 0);
        REQUIRE(r.is<"not_found">());
        CHECK(r.payload<"not_found">() == "two");
    }

    SECTION("identity")
    {
        auto const id = [](int v) { return v; };
        for (auto const* key : {"one", "minus", "huge", "nope"})
            CHECK(same(lookup(key).map(id), lookup(key)));
    }

    SECTION("composition")
    {
        auto const f = [](int v) { return v * 3; };
        auto const g = [](int v) { return v - 1; };
        for (auto const* key : {"one", "minus", "huge", "nope"})
        {
            auto const o = lookup(key);
            CHECK(same(o.map(f).map(g), o.map([&](int v) { return g(f(v)); })));
        }
    }

    SECTION("rvalue map moves the value")
    {
        lc::outcome<std::vector<int>, not_found> o = std::vector<int>{1, 2, 3};
        auto const size = lc::move(o).map([](std::vector<int>&& v) { return int(v.size()); });
        CHECK(size.value() == 3);
    }
}

TEST("combinators - bind")
{
    SECTION("success chains accumulate labels")
    {
        auto const r = lookup("one").bind(check_positive);
        static_assert(std::is_same_v<decltype(r), checked_outcome const>);
        REQUIRE(r.has_value());
        CHECK(r.value() == 1);
    }

    SECTION("the continuation may fail with its own label")
    {
        auto const r = lookup("minus").bind(check_positive);
        REQUIRE(r.is<"negative">());
        CHECK(r.payload<"negative">() == -4);
    }

    SECTION("the first failure short-circuits with label and payload")
    {
        int calls = 0;
        auto const r = lookup("huge").bind(
            [&](int v)
            {
                ++calls;
                return check_positive(v);
            });
        CHECK(calls == 0);
        REQUIRE(r.is<"too_large">());
        CHECK(r.payload<"too_large">() == (1 << 20));
    }

    SECTION("left identity")
    {
        for (auto v : {-3, 0, 8, 5000})
            CHECK(same(lookup_outcome(lc::success(v)).bind(halve), halve(v)));
    }

    SECTION("right identity")
    {
        auto const pure = [](int v) -> lookup_outcome { return lc::success(v); };
        for (auto const* key : {"one", "minus", "huge", "nope"})
            CHECK(same(lookup(key).bind(pure), lookup(key)));
    }

    SECTION("associativity")
    {
        auto const twice = [](int v) -> lookup_outcome { return halve(v).bind(halve); };
        for (auto const* key : {"one", "minus", "huge", "nope"})
        {
            auto const o = lookup(key);
            CHECK(same(o.bind(halve).bind(halve), o.bind(twice)));
        }

        lookup_outcome const big = 4000;
        auto const r = big.bind(halve).bind(halve);
        REQUIRE(r.is<"too_large">());
        CHECK(r.payload<"too_large">() == 2000);
    }
}

TEST("combinators - apply")
{
    using fn_outcome = lc::outcome<int (*)(int), not_found, too_large>;

    fn_outcome const inc = +[](int v) { return v + 1; };
    fn_outcome const no_fn = lc::failure<"not_found">(std::string("fn"));

    SECTION("both successful")
    {
        auto const r = lc::apply(inc, lookup("one"));
        REQUIRE(r.has_value());
        CHECK(r.value() == 2);
    }

    SECTION("argument failure")
    {
        auto const r = lc::apply(inc, lookup("huge"));
        CHECK(r.is<"too_large">());
    }

    SECTION("left failure wins")
    {
        auto const r = lc::apply(no_fn, lookup("huge"));
        REQUIRE(r.is<"not_found">());
        CHECK(r.payload<"not_found">() == "fn");

        auto const r2 = lc::apply(no_fn, lookup("one"));
        REQUIRE(r2.is<"not_found">());
        CHECK(r2.payload<"not_found">() == "fn");
    }
}

TEST("combinators - alt")
{
    lookup_outcome const x = 1;
    lookup_outcome const y = 2;
    lookup_outcome const e1 = lc::failure<"not_found">(std::string("a"));
    lookup_outcome const e2 = lc::failure<"too_large">(9);

    CHECK(same(lc::alt(e1, x), x));
    CHECK(same(lc::alt(x, y), x));
    CHECK(same(lc::alt(x, e1), x));
    CHECK(same(lc::alt(e1, e2), e1));
    CHECK(same(lc::alt(e2, e1), e2));
}

TEST("combinators - extend")
{
    auto const label_length = [](lookup_outcome const& o) { return int(o.active_label().size()); };

    SECTION("success is rewrapped")
    {
        auto const r = lookup("one").extend(label_length);
        static_assert(std::is_same_v<decltype(r), lc::outcome<int, not_found, too_large> const>);
        REQUIRE(r.has_value());
        CHECK(r.value() == 1);
    }

    SECTION("failure becomes a success as well")
    {
        auto const r = lookup("nope").extend(label_length);
        REQUIRE(r.has_value());
        CHECK(r.value() == int(std::string("not_found").size()));
    }

    SECTION("extend sees the whole outcome")
    {
        auto const r = lookup("huge").extend([](lookup_outcome const& o) { return o.value_or(-1); });
        CHECK(r.value() == -1);
    }
}
