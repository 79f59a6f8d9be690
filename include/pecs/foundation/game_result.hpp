#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: explicit success-or-GameError return type.

#include <utility>
#include <variant>

#include "pecs/foundation/game_error.hpp"

namespace pecs::foundation {

/// Result type for every runtime operation that can fail.
///
/// Configuration and serialization failures are reported through this
/// type instead of exceptions.  Expected "missing data" conditions
/// (absent component, unindexed entity) use null/false sentinels instead.
///
/// Example:
/// @code
///   auto grid = SpatialGrid::Create(config);
///   if (!grid) {
///       PECS_LOG_ERROR(LogCategory::Spatial, grid.error().describe());
///       return;
///   }
///   grid.value().InsertEntity(entity);
/// @endcode
template <typename T>
class GameResult {
public:
    static GameResult ok(T value) { return GameResult(std::move(value)); }
    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<GameError>(data_); }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const GameError& error() const& { return std::get<GameError>(data_); }
    [[nodiscard]] GameError& error() & { return std::get<GameError>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit GameResult(T value) : data_(std::move(value)) {}
    explicit GameResult(GameError error) : data_(std::move(error)) {}

    std::variant<T, GameError> data_;
};

/// Specialization for operations with no success payload.
template <>
class GameResult<void> {
public:
    static GameResult ok() { return GameResult(true); }
    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const GameError& error() const& { return error_; }

private:
    explicit GameResult(bool) : success_(true) {}
    explicit GameResult(GameError error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    GameError error_;
};

} // namespace pecs::foundation
