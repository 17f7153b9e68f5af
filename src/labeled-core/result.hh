#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/tagged_union.hh>
#include <labeled-core/utility.hh>

#include <type_traits>

namespace lc
{
/// Marks a value as the error side of a result.
/// Created via lc::error(e), converts into any result<T, E> with E constructible from the payload.
template <class E>
struct as_error_t
{
    E value;
};

/// Usage:
///   lc::result<int, std::string> parse(...)
///   {
///       if (bad)
///           return lc::error("unexpected token");
///       return 42;
///   }
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return {lc::forward<E>(e)};
}

namespace impl
{
template <class T>
struct is_result_t : std::false_type
{
};
template <class T, class E>
struct is_result_t<result<T, E>> : std::true_type
{
};
template <class T>
struct is_as_error_t : std::false_type
{
};
template <class E>
struct is_as_error_t<as_error_t<E>> : std::true_type
{
};
} // namespace impl
} // namespace lc

/// Sum type representing either a success value T or an error value E.
/// This is the binary result that lc::from_result<"label">(r) lifts into a labeled outcome.
/// Default construction yields an error holding E{}.
/// Trivially copyable when T and E are trivially copyable.
template <class T, class E>
struct lc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>, "result values must be object types");
    static_assert(!std::is_reference_v<E> && !std::is_void_v<E>, "result errors must be object types");

    using value_type = T;
    using error_type = E;

    // construction
public:
    result()
        requires std::is_default_constructible_v<E>
      : _data(impl::index_constant<1>{})
    {
    }

    template <class U = std::remove_cv_t<T>>
        requires(!impl::is_result_t<std::remove_cvref_t<U>>::value && !impl::is_as_error_t<std::remove_cvref_t<U>>::value
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) // NOLINT
      : _data(impl::index_constant<0>{}, lc::forward<U>(value))
    {
    }

    template <class G>
        requires std::is_constructible_v<E, G&&>
    result(as_error_t<G> err) // NOLINT
      : _data(impl::index_constant<1>{}, lc::move(err.value))
    {
    }

    /// converts value and error separately, e.g. result<int, int> -> result<long, long>
    template <class U, class G>
        requires(!(std::is_same_v<U, T> && std::is_same_v<G, E>) && std::is_constructible_v<T, U &&>
                 && std::is_constructible_v<E, G &&>)
    explicit(!(std::is_convertible_v<U, T> && std::is_convertible_v<G, E>)) result(result<U, G> rhs) // NOLINT
      : _data(rhs.has_value() ? data_t(impl::index_constant<0>{}, lc::move(rhs).value())
                              : data_t(impl::index_constant<1>{}, lc::move(rhs).error()))
    {
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _data.index() == 0; }
    [[nodiscard]] bool has_error() const { return _data.index() == 1; }

    /// Precondition: has_value()
    [[nodiscard]] T const& value() const& { return _data.template get<0>(); }
    [[nodiscard]] T& value() & { return _data.template get<0>(); }
    [[nodiscard]] T&& value() && { return lc::move(_data.template get<0>()); }

    /// Precondition: has_error()
    [[nodiscard]] E const& error() const& { return _data.template get<1>(); }
    [[nodiscard]] E& error() & { return _data.template get<1>(); }
    [[nodiscard]] E&& error() && { return lc::move(_data.template get<1>()); }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return has_value() ? value() : static_cast<T>(lc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return has_value() ? lc::move(*this).value() : static_cast<T>(lc::forward<U>(fallback));
    }

    template <class G>
    [[nodiscard]] E error_or(G&& fallback) const&
    {
        return has_error() ? error() : static_cast<E>(lc::forward<G>(fallback));
    }
    template <class G>
    [[nodiscard]] E error_or(G&& fallback) &&
    {
        return has_error() ? lc::move(*this).error() : static_cast<E>(lc::forward<G>(fallback));
    }

    // modification
public:
    /// Replaces the current value or error by a value, unchanged if construction throws
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        return _data.template emplace<0>(lc::forward<Args>(args)...);
    }

    /// Replaces the current value or error by an error, unchanged if construction throws
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        return _data.template emplace<1>(lc::forward<Args>(args)...);
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return lhs.has_value() ? lhs.value() == rhs.value() : lhs.error() == rhs.error();
    }

    // members
private:
    using data_t = impl::tagged_union<T, E>;
    data_t _data;
};
