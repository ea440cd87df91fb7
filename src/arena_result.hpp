#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "arena_error.hpp"

// Either a T or the ArenaError explaining why there is none.
// value() on a failed result throws std::logic_error: that is a bug in the
// caller, not a way to report the failure.
template <class T>
class ArenaResult
{
public:
    ArenaResult(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    ArenaResult(ArenaError error) : state_(std::in_place_index<1>, error) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T &value() &
    {
        ensure_value();
        return std::get<0>(state_);
    }
    const T &value() const &
    {
        ensure_value();
        return std::get<0>(state_);
    }
    T &&value() &&
    {
        ensure_value();
        return std::get<0>(std::move(state_));
    }

    ArenaError error() const
    {
        if (ok())
            throw std::logic_error("ArenaResult::error on a successful result");
        return std::get<1>(state_);
    }

    T &operator*() & { return value(); }
    const T &operator*() const & { return value(); }
    T &&operator*() && { return std::move(*this).value(); }

    T *operator->() { return &value(); }
    const T *operator->() const { return &value(); }

private:
    void ensure_value() const
    {
        if (!ok())
            throw std::logic_error(std::string("ArenaResult::value: ") + to_string(std::get<1>(state_)));
    }

    std::variant<T, ArenaError> state_;
};
