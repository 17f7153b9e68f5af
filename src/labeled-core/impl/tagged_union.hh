#pragma once

#include <labeled-core/assert.hh>
#include <labeled-core/fwd.hh>
#include <labeled-core/impl/label_list.hh>
#include <labeled-core/utility.hh>

#include <type_traits>

namespace lc::impl
{
/// Recursive union holding storage for exactly one of Ts... at a time.
/// Never constructs or destroys a member on its own, tagged_union tracks the live slot.
template <class... Ts>
union variadic_storage;

template <>
union variadic_storage<>
{
};

template <class T, class... Rest>
union variadic_storage<T, Rest...>
{
    variadic_storage() {}

    ~variadic_storage()
        requires(std::is_trivially_destructible_v<T> && (std::is_trivially_destructible_v<Rest> && ...))
    = default;
    ~variadic_storage()
        requires(!(std::is_trivially_destructible_v<T> && (std::is_trivially_destructible_v<Rest> && ...)))
    {
    }

    variadic_storage(variadic_storage const&) = default;
    variadic_storage(variadic_storage&&) = default;
    variadic_storage& operator=(variadic_storage const&) = default;
    variadic_storage& operator=(variadic_storage&&) = default;

    T head;
    variadic_storage<Rest...> tail;
};

template <int I, class Storage>
[[nodiscard]] constexpr auto& slot(Storage& s)
{
    if constexpr (I == 0)
        return s.head;
    else
        return impl::slot<I - 1>(s.tail);
}

template <int I>
using index_constant = std::integral_constant<int, I>;

/// Calls f(index_constant<I>{}) for the I in [First, N) equal to index.
/// A linear chain of comparisons, N is the (small, fixed) number of slots.
/// Precondition: First <= index < N
template <class R, int First, int N, class F>
constexpr R dispatch_index(int index, F& f)
{
    static_assert(First < N, "dispatch over an empty slot range");

    if constexpr (First + 1 == N)
    {
        return f(index_constant<First>{});
    }
    else
    {
        if (index == First)
            return f(index_constant<First>{});
        return impl::dispatch_index<R, First + 1, N>(index, f);
    }
}

template <class T, class... Args>
void construct_at(T& target, Args&&... args)
{
    new (lc::placement_new, &target) T(lc::forward<Args>(args)...);
}

/// Index plus storage for one of Ts..., the runtime representation shared by
/// outcome (slot 0 is success), failures (one slot per label) and result (value, error).
/// Exactly one slot is alive at any time.
/// Trivially copyable when all Ts are trivially copyable.
/// A moved-from tagged_union keeps its index, the slot then holds a moved-from object.
template <class... Ts>
struct tagged_union
{
    static constexpr int slot_count = int(sizeof...(Ts));
    static constexpr bool is_trivially_copyable = (std::is_trivially_copyable_v<Ts> && ...);
    static constexpr bool is_trivially_destructible = (std::is_trivially_destructible_v<Ts> && ...);
    static constexpr bool is_copy_constructible = (std::is_copy_constructible_v<Ts> && ...);

    template <int I>
    using slot_type = nth_type<I, Ts...>;

    // construction
public:
    template <int I, class... Args>
    explicit tagged_union(index_constant<I>, Args&&... args) : _index(I)
    {
        static_assert(0 <= I && I < slot_count, "slot index out of range");
        impl::construct_at(impl::slot<I>(_storage), lc::forward<Args>(args)...);
    }

    // trivial copy/move/destroy
public:
    tagged_union(tagged_union&&)
        requires is_trivially_copyable
    = default;
    tagged_union(tagged_union const&)
        requires is_trivially_copyable
    = default;
    tagged_union& operator=(tagged_union&&)
        requires is_trivially_copyable
    = default;
    tagged_union& operator=(tagged_union const&)
        requires is_trivially_copyable
    = default;

    ~tagged_union()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    tagged_union(tagged_union&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _index(rhs._index)
    {
        rhs.visit_slot([this](auto i, auto& value) { impl::construct_at(impl::slot<decltype(i)::value>(_storage), lc::move(value)); });
    }

    tagged_union(tagged_union const& rhs)
        requires(!is_trivially_copyable && is_copy_constructible)
      : _index(rhs._index)
    {
        rhs.visit_slot([this](auto i, auto const& value) { impl::construct_at(impl::slot<decltype(i)::value>(_storage), value); });
    }

    tagged_union& operator=(tagged_union&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this != &rhs)
        {
            destroy_slot();
            _index = rhs._index;
            rhs.visit_slot([this](auto i, auto& value) { impl::construct_at(impl::slot<decltype(i)::value>(_storage), lc::move(value)); });
        }
        return *this;
    }

    /// The copy is made before the live slot is touched, a throwing copy leaves *this unchanged
    tagged_union& operator=(tagged_union const& rhs)
        requires(!is_trivially_copyable && is_copy_constructible)
    {
        if (this != &rhs)
        {
            tagged_union copy(rhs);
            *this = lc::move(copy);
        }
        return *this;
    }

    ~tagged_union()
        requires(!is_trivially_destructible)
    {
        destroy_slot();
    }

    // access
public:
    [[nodiscard]] int index() const { return _index; }

    template <int I>
    [[nodiscard]] slot_type<I>& get()
    {
        LC_ASSERT(_index == I, "accessed an inactive slot");
        return impl::slot<I>(_storage);
    }
    template <int I>
    [[nodiscard]] slot_type<I> const& get() const
    {
        LC_ASSERT(_index == I, "accessed an inactive slot");
        return impl::slot<I>(_storage);
    }

    /// Calls f(index_constant<I>{}, slot) for the live slot I
    template <class F>
    decltype(auto) visit_slot(F&& f)
    {
        using R = decltype(f(index_constant<0>{}, impl::slot<0>(_storage)));
        auto call = [&](auto i) -> R { return f(i, impl::slot<decltype(i)::value>(_storage)); };
        return impl::dispatch_index<R, 0, slot_count>(_index, call);
    }
    template <class F>
    decltype(auto) visit_slot(F&& f) const
    {
        using R = decltype(f(index_constant<0>{}, impl::slot<0>(_storage)));
        auto call = [&](auto i) -> R { return f(i, impl::slot<decltype(i)::value>(_storage)); };
        return impl::dispatch_index<R, 0, slot_count>(_index, call);
    }

    /// Replaces the live slot by a new object in slot I
    /// The new object is built first, a throwing constructor leaves *this unchanged
    template <int I, class... Args>
    slot_type<I>& emplace(Args&&... args)
    {
        tagged_union replacement(index_constant<I>{}, lc::forward<Args>(args)...);
        *this = lc::move(replacement);
        return impl::slot<I>(_storage);
    }

private:
    void destroy_slot()
    {
        if constexpr (!is_trivially_destructible)
            visit_slot(
                [](auto, auto& value)
                {
                    using V = std::remove_cvref_t<decltype(value)>;
                    value.~V();
                });
    }

    // members
private:
    variadic_storage<Ts...> _storage;
    int _index;
};
} // namespace lc::impl
