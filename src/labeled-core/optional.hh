#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/tagged_union.hh>
#include <labeled-core/label.hh>
#include <labeled-core/utility.hh>

#include <type_traits>

/// Marks the empty state in construction, assignment and comparison: opt = lc::nullopt;
/// Not default constructible, so `opt = {}` is not ambiguous.
struct lc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace lc
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace lc

/// A T or nothing, the single-label end of the outcome interop:
///   lc::to_optional(o)                    - keeps the success value, drops every failure label
///   lc::note_absence<"label">(p, opt)     - an empty optional becomes the failure "label"
///
/// Same representation as outcome: slot 0 is the empty state (an lc::unit), slot 1 the value.
/// Like outcome, a moved-from optional stays engaged and holds a moved-from T.
/// Access goes through the checked value(), there is no operator* or operator->.
template <class T>
struct lc::optional
{
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>, "optional values must be object types");

    // construction
public:
    optional() : _data(impl::index_constant<0>{}, unit{}) {}
    optional(nullopt_t) : optional() {} // NOLINT

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) // NOLINT
      : _data(impl::index_constant<1>{}, lc::forward<U>(value))
    {
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _data.index() == 1; }

    /// Precondition: has_value()
    [[nodiscard]] T const& value() const&
    {
        LC_ASSERT(has_value(), "optional is empty");
        return _data.template get<1>();
    }
    [[nodiscard]] T& value() &
    {
        LC_ASSERT(has_value(), "optional is empty");
        return _data.template get<1>();
    }
    [[nodiscard]] T&& value() &&
    {
        LC_ASSERT(has_value(), "optional is empty");
        return lc::move(_data.template get<1>());
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return has_value() ? _data.template get<1>() : static_cast<T>(lc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return has_value() ? lc::move(_data.template get<1>()) : static_cast<T>(lc::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires equality_comparable<T>
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || bool(lhs._data.template get<1>() == rhs._data.template get<1>());
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires equality_comparable<T>
    {
        return lhs.has_value() && bool(lhs._data.template get<1>() == rhs);
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs.has_value(); }

    /// optional<int> == true is almost always a bug
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    using data_t = impl::tagged_union<unit, T>;
    data_t _data;
};
