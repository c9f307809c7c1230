// GpuBind Core
// result.hpp - Value-or-error return type for recoverable failures

#pragma once

#include "assert.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace gpubind::core {

// Wraps an error so it can't be confused with a value of the same type
template<typename E>
struct Unexpected {
    E error;
};

template<typename E>
[[nodiscard]] Unexpected<std::decay_t<E>> unexpected(E&& error) {
    return Unexpected<std::decay_t<E>>{std::forward<E>(error)};
}

template<typename T, typename E>
class [[nodiscard]] Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(Unexpected<E> error) : storage_(std::in_place_index<1>, std::move(error.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & {
        GPUBIND_ASSERT(is_ok(), "called value() on an error result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        GPUBIND_ASSERT(is_ok(), "called value() on an error result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        GPUBIND_ASSERT(is_ok(), "called value() on an error result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E& error() & {
        GPUBIND_ASSERT(is_err(), "called error() on a successful result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        GPUBIND_ASSERT(is_err(), "called error() on a successful result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E&& error() && {
        GPUBIND_ASSERT(is_err(), "called error() on a successful result");
        return std::get<1>(std::move(storage_));
    }

    template<typename U>
    [[nodiscard]] T value_or(U&& fallback) && {
        if (is_ok()) {
            return std::get<0>(std::move(storage_));
        }
        return static_cast<T>(std::forward<U>(fallback));
    }

    // Unwraps the value, treating an error as a broken precondition
    [[nodiscard]] T expect(std::string_view message) && {
        GPUBIND_ASSERT(is_ok(), "{}", message);
        return std::get<0>(std::move(storage_));
    }

private:
    std::variant<T, E> storage_;
};

template<typename E>
class [[nodiscard]] Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(Unexpected<E> error) : error_(std::move(error.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] const E& error() const {
        GPUBIND_ASSERT(is_err(), "called error() on a successful result");
        return *error_;
    }

    void expect(std::string_view message) const {
        GPUBIND_ASSERT(is_ok(), "{}", message);
    }

private:
    std::optional<E> error_;
};

}  // namespace gpubind::core
