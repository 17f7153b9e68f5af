#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   forward_like<Self>(member)  - forward a member with the value category of its owner
//
// Object lifetime:
//   placement_new               - tag for constructing objects in raw storage without <new>
//
// Callable utilities:
//   overloaded(f1, f2, ...)     - combine multiple callables into single overload set
//
// Template metaprogramming:
//   like_t<Self, T>             - T const& for lvalue owners, T&& for rvalue owners
//   equality_comparable<T>      - T supports a == b convertible to bool
//

namespace lc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto b = lc::move(a);              // move construct b from a
///   auto v = lc::move(res).value();    // steal the success payload
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Forwards a member (or a payload) of some owner with the owner's value category
/// Used by the const& / && overload pairs that share one implementation
/// Usage:
///   template <class Self>
///   static decltype(auto) value_of(Self&& self) { return lc::forward_like<Self>(self._value); }
template <class Self, class T>
[[nodiscard]] LC_FORCE_INLINE constexpr auto&& forward_like(T& value) noexcept
{
    if constexpr (std::is_lvalue_reference_v<Self>)
        return value;
    else
        return lc::move(value);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the placement operator new declared below
/// Avoids pulling in <new> for every header that constructs into raw storage
/// Usage:
///   new (lc::placement_new, &slot) T(args...);
struct placement_new_t
{
    explicit placement_new_t() = default;
};
inline constexpr placement_new_t placement_new{};

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Combines multiple callables into a single overload set via variadic inheritance
/// Handy for spelling out per-label failure handlers of lc::outcome::match
/// Usage:
///   auto on_failure = lc::overloaded{
///       [](lc::label_tag<"parse">, std::string const& msg) { return -1; },
///       [](lc::label_tag<"io">, int code) { return code; },
///   };
template <class... Fs>
struct overloaded : Fs...
{
    overloaded(Fs... fs) : Fs(fs)... {}
    using Fs::operator()...;
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// How a member of type T is handed out by an owner accessed as Self
/// Owners are immutable through lvalues, so the lvalue case is always const.
template <class Self, class T>
using like_t = std::conditional_t<std::is_lvalue_reference_v<Self>, T const&, T&&>;

template <class T>
concept equality_comparable = requires(T const& a) { bool(a == a); };

} // namespace lc

/// placement new selected by lc::placement_new
[[nodiscard]] LC_FORCE_INLINE void* operator new(std::size_t, lc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

/// matching placement delete, only called if a constructor throws
LC_FORCE_INLINE void operator delete(void*, lc::placement_new_t, void*) noexcept {}
