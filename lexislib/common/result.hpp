#pragma once

#include <utility>
#include <variant>

namespace Lexis
{

// Either a value or an error. Value and error types must differ.
template<typename T, typename E>
class Result
{
public:
    Result(T value)
        : storage(std::in_place_index<0>, std::move(value))
    {
    }

    Result(E error)
        : storage(std::in_place_index<1>, std::move(error))
    {
    }

    bool is_ok() const { return storage.index() == 0; }
    bool is_error() const { return storage.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    const T& value() const { return std::get<0>(storage); }
    T& value() { return std::get<0>(storage); }

    const E& error() const { return std::get<1>(storage); }
    E& error() { return std::get<1>(storage); }

    T value_or(T fallback) const
    {
        if (is_ok())
        {
            return value();
        }
        return fallback;
    }

private:
    std::variant<T, E> storage;
};

}
