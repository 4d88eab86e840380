#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Wrapper marking a value as the error alternative of a result.
/// Constructed via rc::error(e) so that result<int, int> can tell "value 3" from "error 3".
template <class E>
struct rc::as_error_t
{
    E value;
};

namespace rc
{
/// Usage:
///   if (_size == 0)
///       return rc::error(list_error::empty_list);
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return as_error_t<std::remove_cvref_t<E>>{rc::forward<E>(e)};
}

namespace impl
{
template <class T>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;

template <class T, class E>
constexpr bool is_trivial_result = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
template <class T, class E>
constexpr bool is_trivially_destructible_result
    = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>;
} // namespace impl
} // namespace rc

/// Sum type representing either a success value T or an error value E.
/// Used for operations that can fail in expected ways, e.g. ring_list::remove_index.
///
/// Access is checked: value() asserts has_value(), error() asserts has_error().
/// A default-constructed result holds a value-initialized E (there is no "empty" state).
/// Trivially copyable when T and E are.
template <class T, class E>
struct rc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    result() : _has_value(false) { new (rc::placement_new, &_error) E(); }

    /// success
    template <class U = std::remove_cv_t<T>>
        requires(std::is_constructible_v<T, U> && !impl::is_as_error<std::remove_cvref_t<U>>
                 && !std::is_same_v<std::remove_cvref_t<U>, result>)
    result(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_value) T(rc::forward<U>(value));
    }

    /// failure
    template <class G>
        requires std::is_constructible_v<E, G>
    result(as_error_t<G> err) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_error) E(rc::move(err.value));
    }

    // trivial special members
public:
    result(result&&)
        requires impl::is_trivial_result<T, E>
    = default;
    result(result const&)
        requires impl::is_trivial_result<T, E>
    = default;
    result& operator=(result&&)
        requires impl::is_trivial_result<T, E>
    = default;
    result& operator=(result const&)
        requires impl::is_trivial_result<T, E>
    = default;

    ~result()
        requires impl::is_trivially_destructible_result<T, E>
    = default;

    // non-trivial special members
public:
    result(result&& rhs) noexcept
        requires(!impl::is_trivial_result<T, E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_value) T(rc::move(rhs._value));
        else
            new (rc::placement_new, &_error) E(rc::move(rhs._error));
    }

    result(result const& rhs)
        requires(!impl::is_trivial_result<T, E> && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_value) T(rhs._value);
        else
            new (rc::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!impl::is_trivial_result<T, E>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
            emplace_value(rc::move(rhs._value));
        else
            emplace_error(rc::move(rhs._error));
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!impl::is_trivial_result<T, E> && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
            emplace_value(rhs._value);
        else
            emplace_error(rhs._error);
        return *this;
    }

    ~result()
        requires(!impl::is_trivially_destructible_result<T, E>)
    {
        destroy_active();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Precondition: has_value()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        RC_ASSERT(self.has_value(), "attempted to access value of a result holding an error");
        return static_cast<Self&&>(self)._value;
    }

    /// Precondition: has_error()
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        RC_ASSERT(self.has_error(), "attempted to access error of a result holding a value");
        return static_cast<Self&&>(self)._error;
    }

    [[nodiscard]] T value_or(T fallback) const&
        requires std::is_copy_constructible_v<T>
    {
        return _has_value ? _value : rc::move(fallback);
    }

    [[nodiscard]] E error_or(E fallback) const&
        requires std::is_copy_constructible_v<E>
    {
        return _has_value ? rc::move(fallback) : _error;
    }

    // mutation
public:
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        destroy_active();
        new (rc::placement_new, &_value) T(rc::forward<Args>(args)...);
        _has_value = true;
        return _value;
    }

    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        destroy_active();
        new (rc::placement_new, &_error) E(rc::forward<Args>(args)...);
        _has_value = false;
        return _error;
    }

    // comparison
public:
    /// Equal if both hold equal values or both hold equal errors.
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value ? bool(lhs._value == rhs._value) : bool(lhs._error == rhs._error);
    }

private:
    void destroy_active()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _value.~T();
        }
        else
        {
            if constexpr (!std::is_trivially_destructible_v<E>)
                _error.~E();
        }
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};
