#pragma once

#include <labeled-core/fwd.hh>
#include <labeled-core/label.hh>
#include <labeled-core/markers.hh>
#include <labeled-core/optional.hh>
#include <labeled-core/outcome.hh>
#include <labeled-core/result.hh>
#include <labeled-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Conversions between lc::outcome and the binary vocabulary types
// =========================================================================================================
//
//   from_result<"L">(result<T, E>)          -> outcome<T, label<"L", E>>
//   to_optional(outcome<T, ...>)            -> optional<T>, failures are dropped
//   note_absence<"L">(e, optional<T>)       -> outcome<T, label<"L", E>>
//   note_absence_lazy<"L">(make_e, opt)     -> same, make_e() only runs for an empty optional
//
// The single-label outcomes widen implicitly into any outcome that declares "L":
//
//   lc::outcome<config, lc::label<"io", int>, lc::label<"missing_key", std::string>> read(...)
//   {
//       return lc::note_absence<"missing_key">(std::string("port"), lookup(table, "port"));
//   }
//
// For the reverse direction see outcome::value_or and outcome::failure_or.
//

namespace lc
{
/// The error of r becomes failure Name, the value of r becomes the success value
template <fixed_string Name, class T, class E>
[[nodiscard]] outcome<T, label<Name, E>> from_result(result<T, E> const& r)
{
    if (r.has_value())
        return lc::success(r.value());
    return lc::failure<Name>(r.error());
}
template <fixed_string Name, class T, class E>
[[nodiscard]] outcome<T, label<Name, E>> from_result(result<T, E>&& r)
{
    if (r.has_value())
        return lc::success(lc::move(r).value());
    return lc::failure<Name>(lc::move(r).error());
}

template <class T, class... Labels>
[[nodiscard]] optional<T> to_optional(outcome<T, Labels...> const& o)
{
    return o.match([](auto, auto const&) -> optional<T> { return nullopt; }, [](T const& v) -> optional<T> { return v; });
}
template <class T, class... Labels>
[[nodiscard]] optional<T> to_optional(outcome<T, Labels...>&& o)
{
    return lc::move(o).match([](auto, auto&&) -> optional<T> { return nullopt; },
                             [](T&& v) -> optional<T> { return lc::move(v); });
}

/// An empty opt becomes failure Name carrying payload
template <fixed_string Name, class E, class T>
[[nodiscard]] outcome<T, label<Name, std::decay_t<E>>> note_absence(E&& payload, optional<T> opt)
{
    if (opt.has_value())
        return lc::success(lc::move(opt).value());
    return lc::failure<Name>(lc::forward<E>(payload));
}

/// Like note_absence, but the payload is only built (via make_payload()) when opt is empty
template <fixed_string Name, class F, class T>
[[nodiscard]] outcome<T, label<Name, std::remove_cvref_t<std::invoke_result_t<F&>>>> note_absence_lazy(F&& make_payload, optional<T> opt)
{
    if (opt.has_value())
        return lc::success(lc::move(opt).value());
    return lc::failure<Name>(make_payload());
}
} // namespace lc
