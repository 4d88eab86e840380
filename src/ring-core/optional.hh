#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Marker for "no value" in rc::optional.
/// Has no default constructor so that optional<T> x = {} stays unambiguous.
struct rc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace rc
{
/// Usage: return rc::nullopt; or if (opt == rc::nullopt)
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace rc

/// Either a value of type T or nothing.
/// This is what ring_list::index_of returns: a position, or nothing when no element matches.
///
/// Deliberately narrower than std::optional:
///   - no operator* and operator->, the value is only reachable through value() which asserts has_value()
///   - equality only, no ordering
///   - no implicit conversion to bool
/// optional<T> is trivially copyable and destructible whenever T is.
template <class T>
struct rc::optional
{
    // construction
public:
    /// empty
    optional() = default;

    /// Engaged with value; explicit only when U does not implicitly convert to T.
    template <class U = std::remove_cv_t<T>>
        requires(std::is_constructible_v<T, U> && !std::is_same_v<std::remove_cvref_t<U>, optional>
                 && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial special members when T allows them
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial special members
public:
    /// Moves the value out of rhs and leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Moves the value out of rhs and leaves rhs empty (a self-move empties the optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rc::move(rhs._storage.value);
            else
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));

            _has_value = true;
            rhs.reset();
        }
        else
        {
            reset();
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rhs._storage.value;
            else
                new (rc::placement_new, &_storage.value) T(rhs._storage.value);

            _has_value = true;
        }
        else
        {
            reset();
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    /// Forwards the value category of the optional (deducing this).
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        RC_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns a copy of the value, or fallback when empty.
    [[nodiscard]] T value_or(T fallback) const&
        requires std::is_copy_constructible_v<T>
    {
        return _has_value ? _storage.value : rc::move(fallback);
    }

    // mutation
public:
    /// Destroys the held value, if any.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // comparison
public:
    /// Equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equal if engaged with a value equal to rhs.
    /// Lets callers write list.index_of(3) == 1 without spelling out optional<isize>{1}.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Comparing optional<int> with true/false is almost always a bug.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    rc::storage_for<T> _storage;
    bool _has_value = false;
};
