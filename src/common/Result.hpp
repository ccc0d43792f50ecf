#pragma once

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace wsm::common {

// Either a value or an error. Accessing the wrong alternative throws std::logic_error.
template <typename T, typename E>
class Result {
public:
    static_assert(!std::is_same_v<T, E>, "Result requires distinct value and error types");

    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool ok() const noexcept { return storage_.index() == 0; }

    const T& value() const& {
        if (!ok()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(std::move(storage_));
    }

    const E& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on a success result");
        }
        return std::get<1>(storage_);
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& value)
        : storage_(tag, std::forward<V>(value)) {}

    std::variant<T, E> storage_;
};

}  // namespace wsm::common
