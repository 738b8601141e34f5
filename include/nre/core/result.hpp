#pragma once

/// @file result.hpp
/// @brief Result<T,E> type used by every fallible engine operation.

#include <string>
#include <utility>
#include <variant>

namespace nre {

/// Plain error payload for Result when no richer type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Either a value of type T or an error of type E.
///
/// Pipeline stages never throw across their public API; a stage that can
/// fail for one (game mode, window) slice returns a Result so the caller
/// can keep the other slices.
///
/// Example:
/// @code
///   auto board = engine.buildNationLeaderboard(GameMode::Duel, window);
///   if (!board) {
///       NRE_LOG_WARN(LogCategory::Ranking, board.error().message());
///       return;
///   }
///   publish(board.value());
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the value. Calling this on an error result is undefined.
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return ok_; }
    [[nodiscard]] bool hasError() const noexcept { return !ok_; }
    explicit operator bool() const noexcept { return ok_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : ok_(true) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_ = false;
    E error_;
};

}  // namespace nre
