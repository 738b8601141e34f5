#pragma once

/// @file engine_error.hpp
/// @brief Error type carried by GameResult<T> across the engine.

#include <string>
#include <string_view>
#include <utility>

#include "nre/foundation/error_code.hpp"

namespace nre::foundation {

/// Error code plus a human-readable message and, for slice failures,
/// the scope (game mode / nation) the failure applies to.
class EngineError {
public:
    EngineError() = default;

    explicit EngineError(ErrorCode code)
        : code_(code) {}

    EngineError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    EngineError(ErrorCode code, std::string message, std::string scope)
        : code_(code), message_(std::move(message)), scope_(std::move(scope)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Slice the error belongs to, e.g. "Duel" or "Duel/MC". Empty if global.
    [[nodiscard]] std::string_view scope() const noexcept { return scope_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string scope_;
};

} // namespace nre::foundation
