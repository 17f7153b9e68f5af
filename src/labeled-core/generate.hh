#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/label_list.hh>
#include <labeled-core/impl/tagged_union.hh>
#include <labeled-core/label.hh>
#include <labeled-core/markers.hh>
#include <labeled-core/outcome.hh>
#include <labeled-core/utility.hh>

#include <array>
#include <random>
#include <tuple>
#include <type_traits>

// =========================================================================================================
// Random outcome generation (for property-based tests)
// =========================================================================================================
//
// A generator table has exactly one entry per slot of the outcome, including the success slot "_".
// Each entry is a payload generator g(rng) -> payload. The table is checked for completeness at compile time.
//
//   using O = lc::outcome<int, lc::label<"a", std::string>, lc::label<"b", bool>>;
//
//   auto uniform = lc::make_uniform_generator<O>(lc::gen<"_">(gen_int),      //
//                                                lc::gen<"a">(gen_string),   //
//                                                lc::gen<"b">(gen_bool));
//
//   auto weighted = lc::make_weighted_generator<O>(lc::gen<"_">(8.0, gen_int), //
//                                                  lc::gen<"a">(1.0, gen_string),
//                                                  lc::gen<"b">(1.0, gen_bool));
//
//   std::mt19937_64 rng(seed);
//   O o = uniform(rng);
//
// Any std::uniform_random_bit_generator works as the random source.
// The caller owns it, so generation is reproducible for a fixed seed.
//
// Weights are validated once, when the weighted generator is made:
// negative weights and an all-zero table are misuse (LC_ASSERT), single zero weights disable their label.
//

namespace lc
{
/// one row of a generator table, see lc::gen
template <fixed_string Name, class G>
struct gen_entry
{
    static constexpr auto name = Name;

    f64 weight;
    G generate;
};

/// Generator for slot Name with weight 1 (the weight only matters for weighted generators)
template <fixed_string Name, class G>
[[nodiscard]] gen_entry<Name, std::decay_t<G>> gen(G&& generate)
{
    return {1.0, lc::forward<G>(generate)};
}

template <fixed_string Name, class G>
[[nodiscard]] gen_entry<Name, std::decay_t<G>> gen(f64 weight, G&& generate)
{
    return {weight, lc::forward<G>(generate)};
}

namespace impl
{
template <class T>
struct is_gen_entry_t : std::false_type
{
};
template <fixed_string Name, class G>
struct is_gen_entry_t<gen_entry<Name, G>> : std::true_type
{
};

/// every slot of O has exactly one entry and no entry names anything else
template <class O, class... Entries>
concept covers_slots = any_outcome<O> && (is_gen_entry_t<Entries>::value && ...)
                    && isize(sizeof...(Entries)) == O::label_count + 1 && impl::has_unique_names<Entries...>()
                    && (O::template has_slot<Entries::name> && ...);

/// wraps a generated payload as slot Name of O
template <class O, fixed_string Name, class P>
O inject(P&& payload)
{
    if constexpr (Name == success_label)
        return lc::success(lc::forward<P>(payload));
    else
        return lc::failure<Name>(lc::forward<P>(payload));
}

/// runs the generator of the entry at runtime index i
template <class O, class Rng, class... Entries>
O generate_entry(int i, Rng& rng, std::tuple<Entries...> const& entries)
{
    auto run = [&](auto idx) -> O
    {
        auto const& entry = std::get<decltype(idx)::value>(entries);
        return impl::inject<O, std::remove_cvref_t<decltype(entry)>::name>(entry.generate(rng));
    };
    return impl::dispatch_index<O, 0, int(sizeof...(Entries))>(i, run);
}
} // namespace impl

/// Picks each slot with the same probability
template <class O, class... Entries>
struct uniform_generator
{
    static_assert(impl::covers_slots<O, Entries...>, "the generator table needs exactly one lc::gen entry per slot, \"_\" included");

    explicit uniform_generator(Entries... entries) : _entries(lc::move(entries)...) {}

    template <std::uniform_random_bit_generator Rng>
    O operator()(Rng& rng) const
    {
        std::uniform_int_distribution<int> pick(0, int(sizeof...(Entries)) - 1);
        return impl::generate_entry<O>(pick(rng), rng, _entries);
    }

private:
    std::tuple<Entries...> _entries;
};

/// Picks each slot with probability weight / total weight
template <class O, class... Entries>
struct weighted_generator
{
    static_assert(impl::covers_slots<O, Entries...>, "the generator table needs exactly one lc::gen entry per slot, \"_\" included");

    explicit weighted_generator(Entries... entries) : _weights{entries.weight...}, _entries(lc::move(entries)...)
    {
        for (int i = 0; i < int(_weights.size()); ++i)
        {
            auto const w = _weights[i];
            if (w > 0)
                _last_positive = i;
            LC_ASSERT_ALWAYS(w >= 0, "generator weights must not be negative");
            _total += w;
        }
        LC_ASSERT_ALWAYS(_total > 0, "at least one generator weight must be positive");
    }

    template <std::uniform_random_bit_generator Rng>
    O operator()(Rng& rng) const
    {
        std::uniform_real_distribution<f64> pick(0.0, _total);
        auto const r = pick(rng);

        // walk the cumulative weights, zero weights are never chosen
        // r can round up to _total, the last positive weight takes that case
        int chosen = _last_positive;
        f64 cumulative = 0;
        for (int i = 0; i < int(_weights.size()); ++i)
        {
            if (_weights[i] <= 0)
                continue;

            cumulative += _weights[i];
            if (r < cumulative)
            {
                chosen = i;
                break;
            }
        }

        return impl::generate_entry<O>(chosen, rng, _entries);
    }

    [[nodiscard]] f64 total_weight() const { return _total; }

private:
    std::array<f64, sizeof...(Entries)> _weights;
    f64 _total = 0;
    int _last_positive = 0;
    std::tuple<Entries...> _entries;
};

template <class O, class... Entries>
    requires impl::covers_slots<O, std::decay_t<Entries>...>
[[nodiscard]] uniform_generator<O, std::decay_t<Entries>...> make_uniform_generator(Entries&&... entries)
{
    return uniform_generator<O, std::decay_t<Entries>...>(lc::forward<Entries>(entries)...);
}

template <class O, class... Entries>
    requires impl::covers_slots<O, std::decay_t<Entries>...>
[[nodiscard]] weighted_generator<O, std::decay_t<Entries>...> make_weighted_generator(Entries&&... entries)
{
    return weighted_generator<O, std::decay_t<Entries>...>(lc::forward<Entries>(entries)...);
}
} // namespace lc
