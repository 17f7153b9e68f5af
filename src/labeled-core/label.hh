#pragma once

#include <labeled-core/fwd.hh>

#include <string_view>
#include <type_traits>

/// Compile-time string usable as a non-type template parameter.
/// This is what label names are made of: lc::label<"parse_error", std::string>.
/// Structural by construction (public array member) so that two fixed_strings with the same
/// characters denote the same template argument.
template <lc::isize N>
struct lc::fixed_string
{
    static_assert(N >= 1, "fixed_string is built from a null-terminated literal");

    char chars[N] = {};

    constexpr fixed_string(char const (&str)[N]) // NOLINT
    {
        for (isize i = 0; i < N; ++i)
            chars[i] = str[i];
    }

    /// number of characters without the terminating null
    [[nodiscard]] constexpr isize size() const { return N - 1; }
    [[nodiscard]] constexpr std::string_view view() const { return {chars, size_t(N - 1)}; }

    template <isize M>
    [[nodiscard]] constexpr bool operator==(fixed_string<M> const& rhs) const
    {
        return view() == rhs.view();
    }
    [[nodiscard]] constexpr bool operator==(std::string_view rhs) const { return view() == rhs; }
};

/// The empty payload, for failure labels that carry no information.
struct lc::unit
{
    friend constexpr bool operator==(unit, unit) { return true; }
};

namespace lc
{
/// Name of the reserved success slot.
/// Every outcome has it, no failure label may use it, and it cannot be resolved.
/// It appears wherever labels are listed exhaustively, e.g. in generator tables: lc::gen<"_">(...).
inline constexpr fixed_string success_label = "_";

/// Declares one failure case of an outcome: a unique name plus the payload type carried under it.
/// Usage:
///   using parse_failed = lc::label<"parse_failed", std::string>;
///   using io_failed = lc::label<"io_failed", int>;
///   lc::outcome<config, parse_failed, io_failed> load(...);
template <fixed_string Name, class Payload>
struct label
{
    static_assert(Name.size() > 0, "label names must not be empty");
    static_assert(!(Name == success_label), "\"_\" names the success slot and cannot be used as a failure label");
    static_assert(!std::is_reference_v<Payload> && !std::is_void_v<Payload> && !std::is_const_v<Payload>,
                  "label payloads must be plain object types");

    static constexpr auto name = Name;
    using payload_type = Payload;
};

/// Stateless tag passed to failure handlers so they know (statically) which label is active.
/// decltype(tag)::name is usable as a template argument inside generic handlers.
template <fixed_string Name>
struct label_tag
{
    static constexpr auto name = Name;

    [[nodiscard]] static constexpr std::string_view view() { return Name.view(); }
};

namespace impl
{
template <class T>
struct is_label_t : std::false_type
{
};
template <fixed_string Name, class Payload>
struct is_label_t<label<Name, Payload>> : std::true_type
{
};
} // namespace impl

template <class T>
concept any_label = impl::is_label_t<T>::value;
} // namespace lc
