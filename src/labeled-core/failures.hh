#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/label_list.hh>
#include <labeled-core/impl/tagged_union.hh>
#include <labeled-core/label.hh>
#include <labeled-core/markers.hh>
#include <labeled-core/utility.hh>

#include <string_view>
#include <type_traits>

/// The failure portion of an outcome: exactly one of the declared failure labels is active.
/// There is no success slot, so a failures value is always a failure.
/// Produced by outcome::failure_or and by converting an lc::failure<"name">(payload) marker.
/// Converts back into any outcome that declares all of its labels.
template <class... Labels>
struct lc::failures
{
    static_assert(sizeof...(Labels) > 0, "failures needs at least one label");
    static_assert((any_label<Labels> && ...), "failure cases must be lc::label<\"name\", Payload>");
    static_assert(impl::has_unique_names<Labels...>(), "failure label names must be unique");

    static constexpr isize label_count = isize(sizeof...(Labels));

    template <fixed_string Name>
    static constexpr bool has_label = impl::contains_name<Name, Labels...>;

    template <fixed_string Name>
    using payload_type = impl::payload_of<Name, Labels...>;

    // construction
public:
    template <fixed_string Name, class P>
        requires(has_label<Name> && std::is_constructible_v<payload_type<Name>, P &&>)
    failures(failure_t<Name, P> f) // NOLINT
      : _data(impl::index_constant<int(impl::index_of_name<Name, Labels...>())>{}, lc::move(f.payload))
    {
    }

    // queries and access
public:
    template <fixed_string Name>
        requires has_label<Name>
    [[nodiscard]] bool is() const
    {
        return _data.index() == int(impl::index_of_name<Name, Labels...>());
    }

    [[nodiscard]] std::string_view active_label() const
    {
        static constexpr std::string_view names[] = {Labels::name.view()...};
        return names[_data.index()];
    }

    /// Precondition: is<Name>()
    template <fixed_string Name>
        requires has_label<Name>
    [[nodiscard]] payload_type<Name> const& payload() const&
    {
        LC_ASSERT_SLOT(is<Name>(), "requested payload of an inactive failure label", active_label());
        return _data.template get<int(impl::index_of_name<Name, Labels...>())>();
    }
    template <fixed_string Name>
        requires has_label<Name>
    [[nodiscard]] payload_type<Name>&& payload() &&
    {
        LC_ASSERT_SLOT(is<Name>(), "requested payload of an inactive failure label", active_label());
        return lc::move(_data.template get<int(impl::index_of_name<Name, Labels...>())>());
    }

    // elimination
public:
    /// Calls on_failure(lc::label_tag<"name">{}, payload) for the active label
    /// on_failure must accept every declared label, the result is the common type of all calls.
    template <class OnFailure>
    decltype(auto) match(OnFailure&& on_failure) const&
    {
        return match_impl(*this, on_failure);
    }
    template <class OnFailure>
    decltype(auto) match(OnFailure&& on_failure) &&
    {
        return match_impl(lc::move(*this), on_failure);
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(failures const& lhs, failures const& rhs)
        requires(equality_comparable<typename Labels::payload_type> && ...)
    {
        if (lhs._data.index() != rhs._data.index())
            return false;
        return lhs._data.visit_slot([&](auto i, auto const& payload) -> bool
                                    { return bool(payload == rhs._data.template get<decltype(i)::value>()); });
    }

private:
    template <class Self, class OnFailure>
    static decltype(auto) match_impl(Self&& self, OnFailure& on_failure)
    {
        static_assert((std::is_invocable_v<OnFailure&, label_tag<Labels::name>, like_t<Self, typename Labels::payload_type>> && ...),
                      "the failure handler must accept every declared label");

        using R = std::common_type_t<std::invoke_result_t<OnFailure&, label_tag<Labels::name>, like_t<Self, typename Labels::payload_type>>...>;
        return self._data.visit_slot(
            [&](auto i, auto& payload) -> R
            {
                using label_t = impl::nth_type<decltype(i)::value, Labels...>;
                return on_failure(label_tag<label_t::name>{}, lc::forward_like<Self>(payload));
            });
    }

    // members
private:
    using data_t = impl::tagged_union<typename Labels::payload_type...>;
    data_t _data;
};
