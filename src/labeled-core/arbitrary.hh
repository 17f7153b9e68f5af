#pragma once

#include <labeled-core/fwd.hh>
#include <labeled-core/generate.hh>
#include <labeled-core/label.hh>
#include <labeled-core/optional.hh>
#include <labeled-core/outcome.hh>
#include <labeled-core/utility.hh>

#include <bit>
#include <concepts>
#include <limits>
#include <random>
#include <string>
#include <type_traits>

// =========================================================================================================
// Arbitrary values and perturbation
// =========================================================================================================
//
// lc::arbitrary<T>::generate(rng)       - a random T drawn from any std::uniform_random_bit_generator
// lc::coarbitrary<T>::perturb(v, seed)  - a new seed that depends on v, used to build random functions
//
// Both are customization points: specialize them for your own payload types.
// For outcomes they are derived from the payloads:
//   arbitrary<outcome<...>>    picks a slot uniformly and generates its payload via arbitrary<Payload>
//   coarbitrary<outcome<...>>  scans the declared labels for the active one, mixes its slot index into the seed,
//                              and continues with coarbitrary<Payload>
//
// Usage:
//   std::mt19937_64 rng(42);
//   auto o = lc::arbitrary<lc::outcome<int, lc::label<"a", std::string>>>::generate(rng);
//
//   auto f = lc::make_random_function<int, lc::outcome<int, lc::label<"a", std::string>>>(rng);
//   auto r = o.bind(f); // f is pure: same argument, same result
//

/// 64 bit seed state that values are mixed into
/// Mixing is a splitmix64 finalizer step, so nearby inputs end up far apart.
struct lc::seed
{
    explicit constexpr seed(u64 state) : _state(state) {}

    [[nodiscard]] constexpr u64 value() const { return _state; }

    /// a seed depending on this one and on bits
    [[nodiscard]] constexpr seed mix(u64 bits) const { return seed(finalize(_state ^ finalize(bits + golden_gamma))); }

    /// the n-th independent variant of this seed, used to tell cases apart (labels, empty vs. present, ...)
    [[nodiscard]] constexpr seed variant(isize n) const { return seed(finalize(_state + golden_gamma * (u64(n) + 1))); }

    friend constexpr bool operator==(seed, seed) = default;

private:
    static constexpr u64 golden_gamma = 0x9e3779b97f4a7c15ULL;

    static constexpr u64 finalize(u64 z)
    {
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    u64 _state;
};

namespace lc
{
template <class T>
concept has_arbitrary = requires(std::mt19937_64& rng) {
    { arbitrary<T>::generate(rng) } -> std::convertible_to<T>;
};

template <class T>
concept has_coarbitrary = requires(T const& v, seed s) {
    { coarbitrary<T>::perturb(v, s) } -> std::same_as<seed>;
};
} // namespace lc

//
// arbitrary
//

/// no generation unless specialized
template <class T>
struct lc::arbitrary
{
};

template <>
struct lc::arbitrary<bool>
{
    template <std::uniform_random_bit_generator Rng>
    static bool generate(Rng& rng)
    {
        return std::bernoulli_distribution(0.5)(rng);
    }
};

// constrained partial specializations of the same primary stay inside the namespace
namespace lc
{
/// integers in [-1000, 1000], clamped to the range of T
/// (drawn as i64, std::uniform_int_distribution does not accept the char types)
template <class T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct arbitrary<T>
{
    static constexpr i64 min = !std::is_signed_v<T>                         ? 0
                               : i64(std::numeric_limits<T>::min()) < -1000 ? -1000
                                                                            : i64(std::numeric_limits<T>::min());
    static constexpr i64 max = u64(std::numeric_limits<T>::max()) > 1000 ? 1000 : i64(std::numeric_limits<T>::max());

    template <std::uniform_random_bit_generator Rng>
    static T generate(Rng& rng)
    {
        return T(std::uniform_int_distribution<i64>(min, max)(rng));
    }
};

template <class T>
    requires std::is_floating_point_v<T>
struct arbitrary<T>
{
    template <std::uniform_random_bit_generator Rng>
    static T generate(Rng& rng)
    {
        return std::uniform_real_distribution<T>(T(-1000), T(1000))(rng);
    }
};
} // namespace lc

template <>
struct lc::arbitrary<lc::unit>
{
    template <std::uniform_random_bit_generator Rng>
    static unit generate(Rng&)
    {
        return {};
    }
};

/// up to 16 lowercase letters
template <>
struct lc::arbitrary<std::string>
{
    template <std::uniform_random_bit_generator Rng>
    static std::string generate(Rng& rng)
    {
        auto const size = std::uniform_int_distribution<int>(0, 16)(rng);
        std::uniform_int_distribution<int> letter('a', 'z');

        std::string s;
        s.reserve(size_t(size));
        for (auto i = 0; i < size; ++i)
            s.push_back(char(letter(rng)));
        return s;
    }
};

/// empty in one of four cases
template <class T>
    requires lc::has_arbitrary<T>
struct lc::arbitrary<lc::optional<T>>
{
    template <std::uniform_random_bit_generator Rng>
    static optional<T> generate(Rng& rng)
    {
        if (std::uniform_int_distribution<int>(0, 3)(rng) == 0)
            return nullopt;
        return arbitrary<T>::generate(rng);
    }
};

namespace lc::impl
{
/// payload generator for a generator table, forwards to arbitrary<T>
template <class T>
struct arbitrary_payload
{
    template <class Rng>
    T operator()(Rng& rng) const
    {
        return arbitrary<T>::generate(rng);
    }
};

template <class O>
struct arbitrary_derivation;
template <class T, class... Labels>
struct arbitrary_derivation<outcome<T, Labels...>>
{
    static_assert(has_arbitrary<T>, "the success type has no lc::arbitrary specialization");
    static_assert((has_arbitrary<typename Labels::payload_type> && ...), "a failure payload has no lc::arbitrary specialization");

    static auto make()
    {
        return lc::make_uniform_generator<outcome<T, Labels...>>(
            lc::gen<success_label>(arbitrary_payload<T>{}), lc::gen<Labels::name>(arbitrary_payload<typename Labels::payload_type>{})...);
    }
};
} // namespace lc::impl

namespace lc
{
/// The uniform generator over all slots of O, each payload drawn from its arbitrary specialization
template <class O>
    requires any_outcome<O>
[[nodiscard]] auto make_arbitrary_generator()
{
    return impl::arbitrary_derivation<O>::make();
}
} // namespace lc

template <class T, class... Labels>
    requires(lc::has_arbitrary<T> && (lc::has_arbitrary<typename Labels::payload_type> && ...))
struct lc::arbitrary<lc::outcome<T, Labels...>>
{
    template <std::uniform_random_bit_generator Rng>
    static outcome<T, Labels...> generate(Rng& rng)
    {
        return lc::make_arbitrary_generator<outcome<T, Labels...>>()(rng);
    }
};

//
// coarbitrary
//

/// no perturbation unless specialized
template <class T>
struct lc::coarbitrary
{
};

template <>
struct lc::coarbitrary<bool>
{
    static seed perturb(bool v, seed s) { return s.variant(v ? 1 : 0); }
};

namespace lc
{
template <class T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct coarbitrary<T>
{
    static seed perturb(T v, seed s) { return s.mix(u64(i64(v))); }
};

template <class T>
    requires std::is_floating_point_v<T>
struct coarbitrary<T>
{
    static seed perturb(T v, seed s) { return s.mix(std::bit_cast<u64>(f64(v))); }
};
} // namespace lc

template <>
struct lc::coarbitrary<lc::unit>
{
    static seed perturb(unit, seed s) { return s; }
};

template <>
struct lc::coarbitrary<std::string>
{
    static seed perturb(std::string const& v, seed s)
    {
        s = s.variant(isize(v.size()));
        for (auto const c : v)
            s = s.mix(u64(u8(c)));
        return s;
    }
};

template <class T>
    requires lc::has_coarbitrary<T>
struct lc::coarbitrary<lc::optional<T>>
{
    static seed perturb(optional<T> const& v, seed s)
    {
        if (!v.has_value())
            return s.variant(0);
        return coarbitrary<T>::perturb(v.value(), s.variant(1));
    }
};

/// Different labels always select different seed variants, even for equal payloads
template <class T, class... Labels>
    requires(lc::has_coarbitrary<T> && (lc::has_coarbitrary<typename Labels::payload_type> && ...))
struct lc::coarbitrary<lc::outcome<T, Labels...>>
{
    static seed perturb(outcome<T, Labels...> const& v, seed s)
    {
        using O = outcome<T, Labels...>;
        return v.match(
            [&](auto tag, auto const& payload)
            {
                using P = std::remove_cvref_t<decltype(payload)>;
                return coarbitrary<P>::perturb(payload, s.variant(O::template slot_of<decltype(tag)::name>));
            },
            [&](T const& value) { return coarbitrary<T>::perturb(value, s.variant(0)); });
    }
};

//
// random functions
//

namespace lc
{
/// A pure pseudo-random function A -> B
/// The argument perturbs a fixed seed, the perturbed seed drives arbitrary<B>.
/// Equal arguments give equal results, different arguments (usually) different ones.
template <class A, class B>
struct random_function
{
    static_assert(has_coarbitrary<A>, "random_function arguments need an lc::coarbitrary specialization");
    static_assert(has_arbitrary<B>, "random_function results need an lc::arbitrary specialization");

    explicit random_function(seed s) : _seed(s) {}

    B operator()(A const& a) const
    {
        std::mt19937_64 rng(coarbitrary<A>::perturb(a, _seed).value());
        return arbitrary<B>::generate(rng);
    }

private:
    seed _seed;
};

template <class A, class B, std::uniform_random_bit_generator Rng>
[[nodiscard]] random_function<A, B> make_random_function(Rng& rng)
{
    auto const hi = u64(rng());
    auto const lo = u64(rng());
    return random_function<A, B>(seed((hi << 32) ^ lo));
}
} // namespace lc
