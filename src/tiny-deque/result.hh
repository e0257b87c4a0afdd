#pragma once

#include <tiny-deque/assert.hh>
#include <tiny-deque/fwd.hh>
#include <tiny-deque/utility.hh>

#include <type_traits>

// td::result<T, E> is the channel for EXPECTED failures (a full array_deque, popping an empty deque,
// an index past the end). Programmer errors go through TD_ASSERT instead.
//
// Usage:
//   td::result<int, td::deque_error> r = d.try_pop_front();
//   if (r.has_value())
//       use(r.value());
//   else if (r.error() == td::deque_error::empty_deque)
//       ...
//
//   td::result<void, td::deque_error> parse_step()
//   {
//       if (!ok)
//           return td::error(td::deque_error::capacity_exceeded);
//       return td::success;
//   }

/// Wrapper marking a value as the error alternative of a result.
/// Created via td::error(e).
template <class E>
struct td::as_error_t
{
    E value;
};

namespace td
{
/// Wraps e so that it initializes the error alternative of a result.
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return as_error_t<std::decay_t<E>>{td::forward<E>(e)};
}

/// Tag for the success state of result<void, E>.
struct success_t
{
    explicit success_t() = default;
};
inline constexpr success_t success{};

namespace impl
{
template <class U>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;
} // namespace impl
} // namespace td

/// Sum type holding either a success value T or an error value E.
/// A default-constructed result holds a value-initialized error.
/// Trivially copyable and destructible when both T and E are.
template <class T, class E>
struct td::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    constexpr result() : _error(), _has_value(false) {}

    /// Constructs the value alternative; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !impl::is_as_error<std::remove_cvref_t<U>>)
    explicit(!std::is_convertible_v<U, T>) constexpr result(U&& value) // NOLINT
      : _value(td::forward<U>(value)), _has_value(true)
    {
    }

    /// Constructs the error alternative from td::error(e).
    template <class G>
        requires std::is_constructible_v<E, G &&>
    constexpr result(as_error_t<G>&& err) : _error(td::move(err.value)), _has_value(false) // NOLINT
    {
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) : _error(err.value), _has_value(false) // NOLINT
    {
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (td::placement_new, &_value) T(td::move(rhs._value));
        else
            new (td::placement_new, &_error) E(td::move(rhs._error));
    }

    result(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (td::placement_new, &_value) T(rhs._value);
        else
            new (td::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
                emplace_value(td::move(rhs._value));
            else
                emplace_error(td::move(rhs._error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
                emplace_value(rhs._value);
            else
                emplace_error(rhs._error);
        }
        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Returns the held value.
    /// Precondition: has_value().
    [[nodiscard]] constexpr T& value() &
    {
        TD_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        TD_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        TD_ASSERT(_has_value, "attempted to access value of result holding an error");
        return td::move(_value);
    }

    /// Returns the held error.
    /// Precondition: has_error().
    [[nodiscard]] constexpr E& error() &
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return td::move(_error);
    }

    [[nodiscard]] constexpr T value_or(T fallback) const&
    {
        return _has_value ? _value : fallback;
    }
    [[nodiscard]] constexpr T value_or(T fallback) &&
    {
        return _has_value ? td::move(_value) : td::move(fallback);
    }

    [[nodiscard]] constexpr E error_or(E fallback) const&
    {
        return _has_value ? fallback : _error;
    }
    [[nodiscard]] constexpr E error_or(E fallback) &&
    {
        return _has_value ? td::move(fallback) : td::move(_error);
    }

    // modifiers
public:
    /// Destroys the current alternative and constructs a value in place.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        impl_destroy();
        _has_value = true;
        return *new (td::placement_new, &_value) T(td::forward<Args>(args)...);
    }

    /// Destroys the current alternative and constructs an error in place.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        impl_destroy();
        _has_value = false;
        return *new (td::placement_new, &_error) E(td::forward<Args>(args)...);
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
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
    constexpr void impl_destroy()
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

/// result without a payload: success or an error value E.
/// Default-constructed results hold a value-initialized error, success is td::success.
template <class E>
struct td::result<void, E>
{
    static_assert(!std::is_reference_v<E>, "result does not support references");

public:
    constexpr result() : _error(), _has_value(false) {}
    constexpr result(success_t) : _has_value(true) {} // NOLINT

    template <class G>
        requires std::is_constructible_v<E, G &&>
    constexpr result(as_error_t<G>&& err) : _error(td::move(err.value)), _has_value(false) // NOLINT
    {
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) : _error(err.value), _has_value(false) // NOLINT
    {
    }

    result(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    ~result()
        requires std::is_trivially_destructible_v<E>
    = default;

    result(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (td::placement_new, &_error) E(td::move(rhs._error));
    }
    result(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (td::placement_new, &_error) E(rhs._error);
    }
    result& operator=(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (!_has_value)
                new (td::placement_new, &_error) E(td::move(rhs._error));
        }
        return *this;
    }
    result& operator=(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (!_has_value)
                new (td::placement_new, &_error) E(rhs._error);
        }
        return *this;
    }
    ~result()
        requires(!std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Asserts success; there is no payload to return.
    constexpr void value() const { TD_ASSERT(_has_value, "attempted to access value of result holding an error"); }

    [[nodiscard]] constexpr E& error() &
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        TD_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return td::move(_error);
    }

    [[nodiscard]] constexpr E error_or(E fallback) const& { return _has_value ? fallback : _error; }

    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
        requires requires(E const& e) { bool(e == e); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value || bool(lhs._error == rhs._error);
    }

private:
    constexpr void impl_destroy()
    {
        if constexpr (!std::is_trivially_destructible_v<E>)
            if (!_has_value)
                _error.~E();
    }

private:
    union
    {
        E _error;
    };
    bool _has_value;
};
