
#ifndef wd_utils_wd_nullable_h
#define wd_utils_wd_nullable_h

#include "wd_utils/wd_exception.h"
#include <type_traits>
#include <utility>

namespace wd_utils
{

/// Allows for a nullable value on the stack.
template<typename T>
class wd_nullable
{
public:
    wd_nullable() :
        _value(),
        _is_null(true)
    {
    }

    wd_nullable(const wd_nullable& obj) = default;

    wd_nullable(wd_nullable&& obj) noexcept :
        _value(std::move(obj._value)),
        _is_null(obj._is_null)
    {
        obj._value = T();
        obj._is_null = true;
    }

    wd_nullable(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) :
        _value(std::move(value)),
        _is_null(false)
    {
    }

    wd_nullable(const T& value) :
        _value(value),
        _is_null(false)
    {
    }

    ~wd_nullable() noexcept {}

    wd_nullable& operator = (const wd_nullable& rhs) = default;

    wd_nullable& operator = (wd_nullable&& rhs) noexcept
    {
        _value = std::move(rhs._value);
        _is_null = rhs._is_null;
        rhs._value = T();
        rhs._is_null = true;
        return *this;
    }

    wd_nullable& operator = (const T& rhs)
    {
        _value = rhs;
        _is_null = false;
        return *this;
    }

    explicit operator bool() const
    {
        return !_is_null;
    }

    const T& value() const
    {
        if(_is_null)
            WD_THROW(("Attempting to access null wd_nullable"));
        return _value;
    }

    T value_or(const T& def) const
    {
        return (_is_null) ? def : _value;
    }

    void set_value(T value)
    {
        _value = std::move(value);
        _is_null = false;
    }

    bool is_null() const
    {
        return _is_null;
    }

    void clear()
    {
        _value = T();
        _is_null = true;
    }

    friend bool operator == (const wd_nullable& lhs, const wd_nullable& rhs)
    {
        return (lhs._is_null && rhs._is_null) || (!lhs._is_null && !rhs._is_null && lhs._value == rhs._value);
    }

    friend bool operator == (const wd_nullable& lhs, const T& rhs)
    {
        return !lhs._is_null && lhs._value == rhs;
    }

    friend bool operator != (const wd_nullable& lhs, const wd_nullable& rhs)
    {
        return !(lhs == rhs);
    }

    friend bool operator != (const wd_nullable& lhs, const T& rhs)
    {
        return !(lhs == rhs);
    }

private:
    T _value;
    bool _is_null;
};

}

#endif
