#pragma once

#include "ryuri/core/ErrorCode.hpp"
#include <new>
#include <type_traits>
#include <utility>

namespace ryuri {
namespace core {

/**
 * @brief 值或错误
 *
 * 过滤器链、保护编解码器、批处理调度器的返回类型。
 * 存储层的异常在这些边界处被转换为 Error。
 */
template<typename T, typename E = Error>
class Expected {
public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) { emplaceValue(value); }
    Expected(T&& value) { emplaceValue(std::move(value)); }
    Expected(const E& error) { emplaceError(error); }
    Expected(E&& error) { emplaceError(std::move(error)); }

    Expected(const Expected& other) { copyFrom(other); }
    Expected(Expected&& other) noexcept { moveFrom(std::move(other)); }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            reset();
            copyFrom(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            reset();
            moveFrom(std::move(other));
        }
        return *this;
    }

    ~Expected() { reset(); }

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return has_value_; }

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }
    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    const T& valueOr(const T& fallback) const & noexcept {
        return has_value_ ? value_ : fallback;
    }

    /**
     * @brief 成功时继续执行 func，失败时透传错误
     */
    template<typename F>
    auto andThen(F&& func) -> decltype(func(std::declval<T&>())) {
        using Next = decltype(func(std::declval<T&>()));
        return has_value_ ? func(value_) : Next(error_);
    }

    T& valueOrThrow() & {
        raiseIfError();
        return value_;
    }

    T valueOrThrow() && {
        raiseIfError();
        return std::move(value_);
    }

private:
    template<typename U>
    void emplaceValue(U&& value) {
        new(&value_) T(std::forward<U>(value));
        has_value_ = true;
    }

    template<typename U>
    void emplaceError(U&& error) {
        new(&error_) E(std::forward<U>(error));
        has_value_ = false;
    }

    void copyFrom(const Expected& other) {
        if (other.has_value_) {
            emplaceValue(other.value_);
        } else {
            emplaceError(other.error_);
        }
    }

    void moveFrom(Expected&& other) noexcept {
        if (other.has_value_) {
            emplaceValue(std::move(other.value_));
        } else {
            emplaceError(std::move(other.error_));
        }
    }

    void reset() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    void raiseIfError() const {
        if (has_value_) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw E(error_);
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_ = false;
};

/**
 * @brief 无返回值的特化，只携带错误
 */
template<typename E>
class Expected<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Expected() = default;
    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    void valueOrThrow() const {
        if (has_value_) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw E(error_);
        }
    }

private:
    E error_;
    bool has_value_ = true;
};

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

inline VoidResult ok() {
    return VoidResult();
}

}} // namespace ryuri::core
