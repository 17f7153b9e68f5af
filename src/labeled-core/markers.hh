#pragma once

#include <labeled-core/fwd.hh>
#include <labeled-core/label.hh>
#include <labeled-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Markers
// =========================================================================================================
//
// Small wrappers that record which slot of a labeled union a value is meant for.
// They carry no label set of their own and convert into any outcome (or failures) that can hold them:
//
//   lc::success(x)                  - the success slot
//   lc::failure<"name">(payload)    - the failure slot "name"
//   lc::failure<"name">()           - the failure slot "name" with an lc::unit payload
//   lc::handle<"name">(fn)          - a resolution handler for outcome::resolve_many
//
// Usage:
//   lc::outcome<int, lc::label<"div_by_zero", lc::unit>> divide(int a, int b)
//   {
//       if (b == 0)
//           return lc::failure<"div_by_zero">();
//       return lc::success(a / b);
//   }
//

namespace lc
{
template <class T>
struct success_t
{
    T value;
};

template <fixed_string Name, class P>
struct failure_t
{
    static constexpr auto name = Name;

    P payload;
};

template <fixed_string Name, class F>
struct handler_t
{
    static_assert(!(Name == success_label), "the success slot cannot be resolved");

    static constexpr auto name = Name;

    F fn;
};

template <class T>
[[nodiscard]] constexpr success_t<std::decay_t<T>> success(T&& value)
{
    return {lc::forward<T>(value)};
}

template <fixed_string Name, class P>
[[nodiscard]] constexpr failure_t<Name, std::decay_t<P>> failure(P&& payload)
{
    static_assert(!(Name == success_label), "\"_\" names the success slot, use lc::success instead");
    return {lc::forward<P>(payload)};
}

template <fixed_string Name>
[[nodiscard]] constexpr failure_t<Name, unit> failure()
{
    static_assert(!(Name == success_label), "\"_\" names the success slot, use lc::success instead");
    return {unit{}};
}

/// Handler for one failure label, see outcome::resolve_many
/// lc::handle<"_"> does not exist: the success slot is never resolved.
template <fixed_string Name, class F>
    requires(!(Name == success_label))
[[nodiscard]] constexpr handler_t<Name, std::decay_t<F>> handle(F&& fn)
{
    return {lc::forward<F>(fn)};
}

namespace impl
{
template <class T>
struct is_marker_t : std::false_type
{
};
template <class T>
struct is_marker_t<success_t<T>> : std::true_type
{
};
template <fixed_string Name, class P>
struct is_marker_t<failure_t<Name, P>> : std::true_type
{
};

template <class T>
constexpr bool is_marker = is_marker_t<T>::value;

template <class T>
struct is_handler_t : std::false_type
{
};
template <fixed_string Name, class F>
struct is_handler_t<handler_t<Name, F>> : std::true_type
{
};

template <class T>
constexpr bool is_handler = is_handler_t<T>::value;

/// true if Target declares Label (by name) with a payload constructible from Label's payload
template <class Target, class Label>
[[nodiscard]] consteval bool can_hold_failure()
{
    if constexpr (!Target::template has_label<Label::name>)
        return false;
    else
        return std::is_constructible_v<typename Target::template payload_type<Label::name>, typename Label::payload_type&&>;
}

template <class Target, class... Labels>
constexpr bool can_hold_failures = (impl::can_hold_failure<Target, Labels>() && ...);

/// Failure handler that re-injects the failure under the same label into Target
/// This is how combinators pass failures through unchanged.
template <class Target>
struct forward_failure
{
    template <fixed_string Name, class P>
    Target operator()(label_tag<Name>, P&& payload) const
    {
        return lc::failure<Name>(lc::forward<P>(payload));
    }
};
} // namespace impl
} // namespace lc
