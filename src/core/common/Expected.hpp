#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace Scribe {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

// Value-or-error result, modeled after std::expected.
// Errors are only ever constructed through Unexpected, so T and E may share a type.
template<typename T, typename E>
class Expected {
public:
    using value_type = T;
    using error_type = E;

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : storage_(std::in_place_index<0>) {}

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected)
        : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    const T& value() const& {
        requireValue();
        return std::get<0>(storage_);
    }

    T& value() & {
        requireValue();
        return std::get<0>(storage_);
    }

    T&& value() && {
        requireValue();
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename U>
    T valueOr(U&& fallback) && {
        return hasValue() ? std::get<0>(std::move(storage_)) : static_cast<T>(std::forward<U>(fallback));
    }

    // f(const T&) -> U, result wrapped as Expected<U, E>
    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        using Result = Expected<std::invoke_result_t<F, const T&>, E>;
        if (hasError()) {
            return Result(makeUnexpected(error()));
        }
        if constexpr (std::is_void_v<std::invoke_result_t<F, const T&>>) {
            std::forward<F>(f)(value());
            return Result();
        } else {
            return Result(std::forward<F>(f)(value()));
        }
    }

    // f(const T&) -> Expected<U, E>
    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Result = std::invoke_result_t<F, const T&>;
        if (hasError()) {
            return Result(makeUnexpected(error()));
        }
        return std::forward<F>(f)(value());
    }

private:
    void requireValue() const {
        if (!hasValue()) {
            throw std::logic_error("Expected holds an error, not a value");
        }
    }

    void requireError() const {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
    }

    std::variant<T, E> storage_;
};

template<typename E>
class Expected<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Expected() = default;

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : error_(std::in_place, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : error_(std::in_place, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return !error_.has_value(); }
    bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    void value() const {
        if (hasError()) {
            throw std::logic_error("Expected holds an error, not a value");
        }
    }

    const E& error() const& {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return *error_;
    }

    E& error() & {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return *error_;
    }

    // f() -> Expected<U, E>
    template<typename F>
    auto andThen(F&& f) const -> std::invoke_result_t<F> {
        using Result = std::invoke_result_t<F>;
        if (hasError()) {
            return Result(makeUnexpected(*error_));
        }
        return std::forward<F>(f)();
    }

private:
    std::optional<E> error_;
};

} // namespace Scribe
