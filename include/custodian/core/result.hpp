#pragma once
#include <variant>
#include <utility>
#include <stdexcept>
namespace custodian {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }
    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(std::move(value_));
    }
    // Re-types an Err for early return from a function with a different value type.
    template<typename U>
    [[nodiscard]] Result<U, E> PropagateErr() && {
        if (IsOk()) {
            throw std::runtime_error("Called PropagateErr() on an Ok Result");
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
};
}
