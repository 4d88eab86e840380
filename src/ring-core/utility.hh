#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Object lifetime:
//   placement_new               - tag for constructing into raw storage: new (rc::placement_new, ptr) T(...)
//   storage_for<T>              - uninitialized, correctly aligned storage for exactly one T
//

namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   list.add(rc::move(obj));   // transfer obj into the list
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto size = rc::exchange(rhs._size, 0);              // take rhs's size, leave it empty
///   auto h = rc::exchange(_current, node_handle::invalid);
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = rc::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting ring-core's placement new overload
/// Avoids including <new> in every header just for the standard placement new
struct placement_new_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr placement_new_t(_ctor_tag) {}
};

/// Usage: new (rc::placement_new, &storage.value) T(args...);
constexpr placement_new_t placement_new = placement_new_t{placement_new_t::_ctor_tag::tag};

/// Uninitialized storage for a single T, with the size and alignment of T.
/// The owner decides when storage.value is alive: construct via placement new, destroy via value.~T().
/// Trivially copyable and trivially destructible when T is, so wrappers like optional<int> stay trivial.
template <class T>
union storage_for
{
    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    T value;
};
} // namespace rc

inline void* operator new(std::size_t, rc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

// only called if a constructor invoked through the placement new above throws
inline void operator delete(void*, rc::placement_new_t, void*) noexcept {}
