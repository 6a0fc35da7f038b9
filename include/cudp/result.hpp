#pragma once
#include <stdexcept>
#include <utility>
#include <variant>

namespace cudp {

/**
 * Outcome of a fallible codec operation: either a value or the error
 * that prevented producing it.
 *
 * Both alternatives convert implicitly, so an implementation can simply
 * `return port;` or `return PortError::empty;`.
 *
 * Reading the wrong side (value() of a failure, error() of a success)
 * is a caller bug and throws std::logic_error.
 */
template <typename T, typename E>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : state_(std::in_place_index<1>, error) {}
    Result(E&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& {
        if (!ok()) throw std::logic_error("cudp::Result: value() on failure");
        return std::get<0>(state_);
    }

    T&& value() && {
        if (!ok()) throw std::logic_error("cudp::Result: value() on failure");
        return std::get<0>(std::move(state_));
    }

    const E& error() const {
        if (ok()) throw std::logic_error("cudp::Result: error() on success");
        return std::get<1>(state_);
    }

    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> state_;
};

} // namespace cudp
