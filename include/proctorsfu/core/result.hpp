// ProctorSFU - Exam Proctoring Media Server
// Success-or-error return type used across component boundaries

#ifndef PROCTORSFU_CORE_RESULT_HPP
#define PROCTORSFU_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace proctorsfu {
namespace core {

/**
 * @brief Holds either a value of type T or an error of type E.
 *
 * Components never throw across their public interfaces; every fallible
 * operation hands back a Result instead. Accessing the wrong alternative
 * throws std::logic_error, which indicates a programming error.
 *
 * @tparam T Success value type
 * @tparam E Error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if the result holds an error
     */
    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error.
     * @throws std::logic_error if the result holds a value
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Value if successful, otherwise the supplied fallback.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        if (isSuccess()) {
            return std::get<0>(storage_);
        }
        return fallback;
    }

    [[nodiscard]] T valueOr(T fallback) && {
        if (isSuccess()) {
            return std::get<0>(std::move(storage_));
        }
        return fallback;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v)
        : storage_(tag, std::forward<U>(v)) {}

    void requireValue() const {
        if (!isSuccess()) {
            throw std::logic_error("Result: value() called on an error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Result: error() called on a success result");
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return ok_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !ok_;
    }

    [[nodiscard]] E& error() & {
        if (ok_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (ok_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() : error_{}, ok_(true) {}
    explicit Result(E err) : error_(std::move(err)), ok_(false) {}

    E error_;
    bool ok_;
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_RESULT_HPP
