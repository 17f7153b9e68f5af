#pragma once

#include <labeled-core/fwd.hh>
#include <labeled-core/label.hh>

#include <string_view>
#include <tuple>
#include <type_traits>

// Type-level helpers over lists of "named" types.
// A named type is anything with a static constexpr fixed_string member `name`:
// lc::label, lc::label_tag, resolution handlers and generator entries all qualify.

namespace lc::impl
{
template <class... Ts>
struct type_list
{
};

template <isize I, class... Ts>
using nth_type = std::tuple_element_t<size_t(I), std::tuple<Ts...>>;

/// Index of the first named type called Name, -1 if there is none
template <fixed_string Name, class... Named>
[[nodiscard]] consteval isize index_of_name()
{
    constexpr bool matches[] = {(Named::name == Name)..., false};
    for (isize i = 0; i < isize(sizeof...(Named)); ++i)
        if (matches[i])
            return i;
    return -1;
}

template <fixed_string Name, class... Named>
constexpr bool contains_name = index_of_name<Name, Named...>() >= 0;

template <class... Named>
[[nodiscard]] consteval bool has_unique_names()
{
    constexpr std::string_view names[] = {Named::name.view()..., ""};
    for (isize i = 0; i < isize(sizeof...(Named)); ++i)
        for (isize j = i + 1; j < isize(sizeof...(Named)); ++j)
            if (names[i] == names[j])
                return false;
    return true;
}

/// Payload type of the label called Name, no member type if Name is not declared
/// (lookups of undeclared labels fail softly so that constrained accessors can reject them)
template <fixed_string Name, class... Labels>
struct payload_of_t
{
};
template <fixed_string Name, class... Labels>
    requires(contains_name<Name, Labels...>)
struct payload_of_t<Name, Labels...>
{
    using type = typename nth_type<index_of_name<Name, Labels...>(), Labels...>::payload_type;
};
template <fixed_string Name, class... Labels>
using payload_of = typename payload_of_t<Name, Labels...>::type;

/// true if some named type in Named... has the same name as N
template <class N, class... Named>
constexpr bool is_named_in = ((Named::name == N::name) || ...);

/// returns the first argument whose type is named Name
/// Precondition (static): such an argument exists
template <fixed_string Name, class H, class... Hs>
[[nodiscard]] constexpr auto& find_named(H& head, Hs&... tail)
{
    if constexpr (std::remove_cvref_t<H>::name == Name)
        return head;
    else
    {
        static_assert(sizeof...(Hs) > 0, "no entry with the requested name");
        return impl::find_named<Name>(tail...);
    }
}

//
// list concatenation and filtering
//

template <class... Lists>
struct concat_t;
template <>
struct concat_t<>
{
    using type = type_list<>;
};
template <class... A>
struct concat_t<type_list<A...>>
{
    using type = type_list<A...>;
};
template <class... A, class... B, class... Rest>
struct concat_t<type_list<A...>, type_list<B...>, Rest...> : concat_t<type_list<A..., B...>, Rest...>
{
};
template <class... Lists>
using concat = typename concat_t<Lists...>::type;

/// Labels... without every label named by one of Removed...
template <class LabelList, class... Removed>
struct without_names_t;
template <class... Labels, class... Removed>
struct without_names_t<type_list<Labels...>, Removed...>
{
    using type = concat<std::conditional_t<is_named_in<Labels, Removed...>, type_list<>, type_list<Labels>>...>;
};
template <class LabelList, class... Removed>
using without_names = typename without_names_t<LabelList, Removed...>::type;

/// outcome<T, Labels...> from a type_list of labels
template <class T, class LabelList>
struct outcome_of_t;
template <class T, class... Labels>
struct outcome_of_t<T, type_list<Labels...>>
{
    using type = outcome<T, Labels...>;
};
template <class T, class LabelList>
using outcome_of = typename outcome_of_t<T, LabelList>::type;

//
// outcome traits
//

template <class T>
struct is_outcome_t : std::false_type
{
};
template <class T, class... Labels>
struct is_outcome_t<outcome<T, Labels...>> : std::true_type
{
};

template <class T>
struct is_failures_t : std::false_type
{
};
template <class... Labels>
struct is_failures_t<failures<Labels...>> : std::true_type
{
};
} // namespace lc::impl

namespace lc
{
template <class T>
concept any_outcome = impl::is_outcome_t<std::remove_cvref_t<T>>::value;
}
