#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/failures.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/label_list.hh>
#include <labeled-core/impl/tagged_union.hh>
#include <labeled-core/label.hh>
#include <labeled-core/markers.hh>
#include <labeled-core/utility.hh>

#include <string_view>
#include <type_traits>

// =========================================================================================================
// lc::outcome - a success value or one of several labeled failures
// =========================================================================================================
//
// outcome<T, label<"a", A>, label<"b", B>, ...> holds exactly one of
//   - the success value of type T (slot "_")
//   - the payload of one declared failure label
//
// The label set is part of the type. Failures from different sources combine by declaring the union of
// their labels, and resolving a label removes it from the type:
//
//   using config_outcome = lc::outcome<config, lc::label<"not_found", std::string>, lc::label<"malformed", int>>;
//
//   config_outcome load(std::string const& path);
//
//   auto cfg = load(path)
//                  .resolve<"not_found">([](std::string const&) { return config::defaults(); }) // outcome<config, malformed>
//                  .resolve<"malformed">([](int line) { return config::defaults(); })           // outcome<config>
//                  .extract();                                                                    // config
//
// Construction:
//   from a T (implicit), lc::success(x), lc::failure<"name">(payload),
//   or from another outcome / failures whose labels are all declared here (widening)
//
// Elimination:
//   match(on_failure, on_success)  - on_failure(lc::label_tag<"name">{}, payload) must accept every label
//
// Combinators (all built on match):
//   map, bind, extend, lc::apply, lc::alt
//
// Narrowing:
//   resolve<"name">(fn), resolve_many(lc::handle<"a">(fa), ...), extract()
//
// Payloads are immutable: they are handed out as const& from lvalues and as && from rvalues.
// A moved-from outcome keeps its active label.
// outcome is trivially copyable whenever T and all payloads are.
//

template <class T, class... Labels>
struct lc::outcome
{
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>, "outcome success values must be object types");
    static_assert((any_label<Labels> && ...), "outcome failure cases must be lc::label<\"name\", Payload>");
    static_assert(impl::has_unique_names<Labels...>(), "failure label names must be unique");

    using value_type = T;
    using label_list = impl::type_list<Labels...>;

    static constexpr isize label_count = isize(sizeof...(Labels));

    template <fixed_string Name>
    static constexpr bool has_label = impl::contains_name<Name, Labels...>;

    /// true for "_" and every declared failure label
    template <fixed_string Name>
    static constexpr bool has_slot = Name == success_label || has_label<Name>;

    /// slot 0 is success, failure labels follow in declaration order
    template <fixed_string Name>
        requires has_slot<Name>
    static constexpr int slot_of = Name == success_label ? 0 : int(impl::index_of_name<Name, Labels...>()) + 1;

    template <fixed_string Name>
    using payload_type = impl::payload_of<Name, Labels...>;

    // construction
public:
    /// implicit success from a T
    template <class U = std::remove_cv_t<T>>
        requires(!impl::is_marker<std::remove_cvref_t<U>> && !any_outcome<U>
                 && !impl::is_failures_t<std::remove_cvref_t<U>>::value && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) outcome(U&& value) // NOLINT
      : _data(impl::index_constant<0>{}, lc::forward<U>(value))
    {
    }

    template <class U>
        requires std::is_constructible_v<T, U&&>
    outcome(success_t<U> s) // NOLINT
      : _data(impl::index_constant<0>{}, lc::move(s.value))
    {
    }

    /// only for declared labels with a compatible payload
    template <fixed_string Name, class P>
        requires(has_label<Name> && std::is_constructible_v<payload_type<Name>, P &&>)
    outcome(failure_t<Name, P> f) // NOLINT
      : _data(impl::index_constant<slot_of<Name>>{}, lc::move(f.payload))
    {
    }

    /// widening: every label of the source must be declared here
    /// e.g. outcome<int, label<"a", int>> -> outcome<long, label<"b", bool>, label<"a", long>>
    template <class U, class... Others>
        requires(!std::is_same_v<outcome<U, Others...>, outcome> && std::is_constructible_v<T, U &&>
                 && impl::can_hold_failures<outcome, Others...>)
    outcome(outcome<U, Others...> rhs) // NOLINT
      : outcome(lc::move(rhs).match(impl::forward_failure<outcome>{}, [](U&& v) -> outcome { return lc::success(lc::move(v)); }))
    {
    }

    template <class... Others>
        requires impl::can_hold_failures<outcome, Others...>
    outcome(failures<Others...> rhs) // NOLINT
      : outcome(lc::move(rhs).match(impl::forward_failure<outcome>{}))
    {
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _data.index() == 0; }
    [[nodiscard]] bool has_failure() const { return _data.index() != 0; }

    /// is<"_">() is the same as has_value()
    template <fixed_string Name>
        requires has_slot<Name>
    [[nodiscard]] bool is() const
    {
        return _data.index() == slot_of<Name>;
    }

    /// "_" for success, otherwise the name of the active failure label
    [[nodiscard]] std::string_view active_label() const
    {
        static constexpr std::string_view names[] = {success_label.view(), Labels::name.view()...};
        return names[_data.index()];
    }

    /// Precondition: has_value()
    [[nodiscard]] T const& value() const&
    {
        LC_ASSERT_SLOT(has_value(), "outcome does not hold a success value", active_label());
        return _data.template get<0>();
    }
    [[nodiscard]] T&& value() &&
    {
        LC_ASSERT_SLOT(has_value(), "outcome does not hold a success value", active_label());
        return lc::move(_data.template get<0>());
    }

    /// Precondition: is<Name>()
    template <fixed_string Name>
        requires has_label<Name>
    [[nodiscard]] payload_type<Name> const& payload() const&
    {
        LC_ASSERT_SLOT(is<Name>(), "requested payload of an inactive failure label", active_label());
        return _data.template get<slot_of<Name>>();
    }
    template <fixed_string Name>
        requires has_label<Name>
    [[nodiscard]] payload_type<Name>&& payload() &&
    {
        LC_ASSERT_SLOT(is<Name>(), "requested payload of an inactive failure label", active_label());
        return lc::move(_data.template get<slot_of<Name>>());
    }

    /// success value, or the fallback for any failure
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return match([&](auto, auto const&) -> T { return static_cast<T>(lc::forward<U>(fallback)); },
                     [](T const& v) -> T { return v; });
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return lc::move(*this).match([&](auto, auto&&) -> T { return static_cast<T>(lc::forward<U>(fallback)); },
                                     [](T&& v) -> T { return lc::move(v); });
    }

    /// like value_or, but make_fallback() is only called on failure
    template <class F>
    [[nodiscard]] T value_or_else(F&& make_fallback) const&
    {
        return match([&](auto, auto const&) -> T { return make_fallback(); }, [](T const& v) -> T { return v; });
    }
    template <class F>
    [[nodiscard]] T value_or_else(F&& make_fallback) &&
    {
        return lc::move(*this).match([&](auto, auto&&) -> T { return make_fallback(); },
                                     [](T&& v) -> T { return lc::move(v); });
    }

    /// success yields fallback, a failure yields on_failure(lc::failures<Labels...>)
    template <class D, class F>
        requires(sizeof...(Labels) > 0)
    [[nodiscard]] auto failure_or(D&& fallback, F&& on_failure) const&
    {
        using R = std::common_type_t<std::decay_t<D>, std::invoke_result_t<F&, failures<Labels...>>>;
        return match([&](auto tag, auto const& payload) -> R
                     { return on_failure(failures<Labels...>(lc::failure<decltype(tag)::name>(payload))); },
                     [&](T const&) -> R { return lc::forward<D>(fallback); });
    }

    /// like failure_or, but make_fallback() is only called on success
    template <class D, class F>
        requires(sizeof...(Labels) > 0)
    [[nodiscard]] auto failure_or_else(D&& make_fallback, F&& on_failure) const&
    {
        using R = std::common_type_t<std::invoke_result_t<D&>, std::invoke_result_t<F&, failures<Labels...>>>;
        return match([&](auto tag, auto const& payload) -> R
                     { return on_failure(failures<Labels...>(lc::failure<decltype(tag)::name>(payload))); },
                     [&](T const&) -> R { return make_fallback(); });
    }

    // elimination
public:
    /// Calls on_success(value) or on_failure(lc::label_tag<"name">{}, payload)
    /// on_failure must accept every declared label, the result is the common type of all calls.
    /// Usage:
    ///   auto text = o.match([](auto tag, auto const& payload) { return std::string(tag.view()); },
    ///                       [](int v) { return std::to_string(v); });
    template <class OnFailure, class OnSuccess>
    decltype(auto) match(OnFailure&& on_failure, OnSuccess&& on_success) const&
    {
        return match_impl(*this, on_failure, on_success);
    }
    template <class OnFailure, class OnSuccess>
    decltype(auto) match(OnFailure&& on_failure, OnSuccess&& on_success) &&
    {
        return match_impl(lc::move(*this), on_failure, on_success);
    }

    // combinators
public:
    /// outcome<f(value), Labels...>, failures pass through
    template <class F>
    [[nodiscard]] auto map(F&& f) const&
    {
        return map_impl(*this, f);
    }
    template <class F>
    [[nodiscard]] auto map(F&& f) &&
    {
        return map_impl(lc::move(*this), f);
    }

    /// f(value) on success, failures pass through into f's outcome type
    /// f must return an outcome that declares every label of this one (and may add more)
    template <class F>
    [[nodiscard]] auto bind(F&& f) const&
    {
        return bind_impl(*this, f);
    }
    template <class F>
    [[nodiscard]] auto bind(F&& f) &&
    {
        return bind_impl(lc::move(*this), f);
    }

    /// success(f(*this)) with the same labels, for successes and failures alike
    template <class F>
    [[nodiscard]] auto extend(F&& f) const&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, outcome const&>>;
        return outcome<U, Labels...>(lc::success(f(*this)));
    }

    // narrowing
public:
    /// Turns failure Name into a success via f(payload), the result no longer declares Name
    template <fixed_string Name, class F>
        requires has_label<Name>
    [[nodiscard]] auto resolve(F&& f) const&
    {
        auto handler = lc::handle<Name>(lc::forward<F>(f));
        return resolve_many_impl(*this, handler);
    }
    template <fixed_string Name, class F>
        requires has_label<Name>
    [[nodiscard]] auto resolve(F&& f) &&
    {
        auto handler = lc::handle<Name>(lc::forward<F>(f));
        return resolve_many_impl(lc::move(*this), handler);
    }

    /// resolve for several labels at once, the result declares none of the handled labels
    /// Usage:
    ///   lc::outcome<int> r = o.resolve_many(lc::handle<"a">([](int a) { return a; }),
    ///                                       lc::handle<"b">([](std::string const& b) { return int(b.size()); }));
    template <class... Handlers>
        requires((impl::is_handler<Handlers> && ...) && (has_label<Handlers::name> && ...) && impl::has_unique_names<Handlers...>())
    [[nodiscard]] auto resolve_many(Handlers... handlers) const&
    {
        return resolve_many_impl(*this, handlers...);
    }
    template <class... Handlers>
        requires((impl::is_handler<Handlers> && ...) && (has_label<Handlers::name> && ...) && impl::has_unique_names<Handlers...>())
    [[nodiscard]] auto resolve_many(Handlers... handlers) &&
    {
        return resolve_many_impl(lc::move(*this), handlers...);
    }

    /// the success value of an outcome without failure labels
    [[nodiscard]] T extract() const&
        requires(sizeof...(Labels) == 0)
    {
        return _data.template get<0>();
    }
    [[nodiscard]] T extract() &&
        requires(sizeof...(Labels) == 0)
    {
        return lc::move(_data.template get<0>());
    }

    // comparison
public:
    /// same active label and equal payloads
    [[nodiscard]] friend bool operator==(outcome const& lhs, outcome const& rhs)
        requires(equality_comparable<T> && (equality_comparable<typename Labels::payload_type> && ...))
    {
        if (lhs._data.index() != rhs._data.index())
            return false;
        return lhs._data.visit_slot([&](auto i, auto const& payload) -> bool
                                    { return bool(payload == rhs._data.template get<decltype(i)::value>()); });
    }

    // implementation
private:
    template <class Self, class OnFailure, class OnSuccess>
    static decltype(auto) match_impl(Self&& self, OnFailure& on_failure, OnSuccess& on_success)
    {
        using value_ref = like_t<Self, T>;

        static_assert(std::is_invocable_v<OnSuccess&, value_ref>, "the success handler must accept the success value");
        static_assert((std::is_invocable_v<OnFailure&, label_tag<Labels::name>, like_t<Self, typename Labels::payload_type>> && ...),
                      "the failure handler must accept every declared label");

        using R = std::common_type_t<std::invoke_result_t<OnSuccess&, value_ref>,
                                     std::invoke_result_t<OnFailure&, label_tag<Labels::name>, like_t<Self, typename Labels::payload_type>>...>;

        return self._data.visit_slot(
            [&](auto i, auto& payload) -> R
            {
                constexpr int slot = decltype(i)::value;
                if constexpr (slot == 0)
                    return on_success(lc::forward_like<Self>(payload));
                else
                    return on_failure(label_tag<impl::nth_type<slot - 1, Labels...>::name>{}, lc::forward_like<Self>(payload));
            });
    }

    template <class Self, class F>
    static auto map_impl(Self&& self, F& f)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, like_t<Self, T>>>;
        static_assert(!std::is_void_v<U>, "map functions must return a value");

        using R = outcome<U, Labels...>;
        return lc::forward<Self>(self).match(impl::forward_failure<R>{},
                                             [&](like_t<Self, T> v) -> R
                                             { return lc::success(f(lc::forward<like_t<Self, T>>(v))); });
    }

    template <class Self, class F>
    static auto bind_impl(Self&& self, F& f)
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, like_t<Self, T>>>;
        static_assert(any_outcome<R>, "bind functions must return an lc::outcome");
        static_assert(impl::can_hold_failures<R, Labels...>,
                      "the outcome returned by a bind function must declare every failure label of the input");

        return lc::forward<Self>(self).match(impl::forward_failure<R>{},
                                             [&](like_t<Self, T> v) -> R { return f(lc::forward<like_t<Self, T>>(v)); });
    }

    template <class Self, class... Handlers>
    static auto resolve_many_impl(Self&& self, Handlers&... handlers)
    {
        using R = impl::outcome_of<T, impl::without_names<label_list, Handlers...>>;

        return lc::forward<Self>(self).match(
            [&](auto tag, auto&& payload) -> R
            {
                using tag_t = decltype(tag);
                if constexpr (impl::contains_name<tag_t::name, Handlers...>)
                    return lc::success(impl::find_named<tag_t::name>(handlers...).fn(lc::forward<decltype(payload)>(payload)));
                else
                    return lc::failure<tag_t::name>(lc::forward<decltype(payload)>(payload));
            },
            [](like_t<Self, T> v) -> R { return lc::success(lc::forward<like_t<Self, T>>(v)); });
    }

    // members
private:
    using data_t = impl::tagged_union<T, typename Labels::payload_type...>;
    data_t _data;
};

namespace lc
{
/// ff's function applied to fa's value, the failure of ff wins over the failure of fa
/// Usage:
///   lc::outcome<int, parse_failed> r = lc::apply(parse_op(text), parse_int(text));
template <class F, class A, class... Labels>
[[nodiscard]] auto apply(outcome<F, Labels...> const& ff, outcome<A, Labels...> const& fa)
{
    using B = std::remove_cvref_t<std::invoke_result_t<F const&, A const&>>;
    using R = outcome<B, Labels...>;
    return ff.match(impl::forward_failure<R>{}, [&](F const& f) -> R { return fa.map(f); });
}

/// right if left is a failure and right a success, otherwise left
/// Two failures yield the left one, it is not a failure combiner.
template <class T, class... Labels>
[[nodiscard]] outcome<T, Labels...> alt(outcome<T, Labels...> left, outcome<T, Labels...> right)
{
    bool const use_right = left.match([](auto, auto const&) { return true; }, [](T const&) { return false; })
                        && right.match([](auto, auto const&) { return false; }, [](T const&) { return true; });
    return use_right ? lc::move(right) : lc::move(left);
}
} // namespace lc
