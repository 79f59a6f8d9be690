#pragma once

/// @file math_types.hpp
/// @brief Lightweight 2D math types for the game logic layer.

#include <cmath>

namespace pecs::game {

/// Two-component vector used for normals, penetration depths and contact
/// points.  Doubles match the storage type of component fields.
struct Vector2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vector2() = default;
    constexpr Vector2(double x, double y) : x(x), y(y) {}

    // Arithmetic operators.
    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(double scalar) const noexcept {
        return {x * scalar, y * scalar};
    }
    constexpr Vector2 operator-() const noexcept { return {-x, -y}; }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    /// Dot product.
    [[nodiscard]] constexpr double Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr double LengthSquared() const noexcept { return Dot(*this); }

    /// Magnitude.
    [[nodiscard]] double Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// The zero vector.
    [[nodiscard]] static constexpr Vector2 Zero() noexcept { return {}; }

    constexpr bool operator==(const Vector2&) const = default;
};

/// Scalar * Vector2.
constexpr Vector2 operator*(double scalar, const Vector2& v) noexcept {
    return v * scalar;
}

/// Axis-aligned box given by its top-left corner and size (y grows down).
struct Aabb {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] constexpr Vector2 Center() const noexcept {
        return {x + width / 2.0, y + height / 2.0};
    }

    /// Strict overlap: touching edges do not intersect.
    [[nodiscard]] constexpr bool Intersects(const Aabb& o) const noexcept {
        return x < o.x + o.width && x + width > o.x && y < o.y + o.height && y + height > o.y;
    }
};

}  // namespace pecs::game
