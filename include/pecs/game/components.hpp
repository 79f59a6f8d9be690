#pragma once

/// @file components.hpp
/// @brief Typed views over the well-known component records.
///
/// Components are stored as open ComponentData records.  Each view reads
/// a record with defaults for absent fields and writes back only the
/// fields it owns, so unknown fields added by gameplay code survive.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pecs/ecs/value.hpp"

namespace pecs::game {

using ecs::ComponentData;

/// Well-known component kinds.
namespace kinds {
inline constexpr std::string_view kTransform = "transform";
inline constexpr std::string_view kPosition = "position";
inline constexpr std::string_view kPhysics = "physics";
inline constexpr std::string_view kCollider = "collider";
inline constexpr std::string_view kType = "type";
inline constexpr std::string_view kRenderer = "renderer";
}  // namespace kinds

/// `transform { x, y, width, height, rotation }`
struct Transform {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;

    [[nodiscard]] static Transform FromData(const ComponentData& data);
    void WriteTo(ComponentData& data) const;
    [[nodiscard]] ComponentData ToData() const;
};

/// `position { x, y }`, the kind indexed by the world's spatial grid.
struct Position {
    double x = 0.0;
    double y = 0.0;

    [[nodiscard]] static Position FromData(const ComponentData& data);
    void WriteTo(ComponentData& data) const;
    [[nodiscard]] ComponentData ToData() const;
};

/// `physics { velocityX, velocityY, gravity, affectedByGravity, friction,
/// airResistance, dampening, isGrounded, disabled }`
///
/// Optional fields are absent unless set; absent means "not configured"
/// rather than zero.
struct Physics {
    double velocityX = 0.0;
    double velocityY = 0.0;
    std::optional<double> gravity;
    bool affectedByGravity = false;
    std::optional<double> friction;
    std::optional<double> airResistance;
    std::optional<double> dampening;
    bool isGrounded = false;
    bool disabled = false;

    [[nodiscard]] static Physics FromData(const ComponentData& data);
    void WriteTo(ComponentData& data) const;
    [[nodiscard]] ComponentData ToData() const;
};

/// `collider { layer, collidesWithLayers[], width, height, offsetX,
/// offsetY, isSolid, isTrigger }`
///
/// A width or height of zero (or absent) falls back to the transform size.
struct Collider {
    std::string layer;
    std::vector<std::string> collidesWithLayers;
    double width = 0.0;
    double height = 0.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
    bool isSolid = true;
    bool isTrigger = false;

    /// True if @p other is listed in collidesWithLayers.
    [[nodiscard]] bool CollidesWith(std::string_view other) const;

    [[nodiscard]] static Collider FromData(const ComponentData& data);
    void WriteTo(ComponentData& data) const;
    [[nodiscard]] ComponentData ToData() const;
};

/// `type { name }`, used to qualify collision events.
struct TypeInfo {
    std::string name = "entity";

    [[nodiscard]] static TypeInfo FromData(const ComponentData& data);
    [[nodiscard]] ComponentData ToData() const;
};

/// `renderer { layer, visible }`
struct Renderer {
    double layer = 0.0;
    bool visible = true;

    [[nodiscard]] static Renderer FromData(const ComponentData& data);
    [[nodiscard]] ComponentData ToData() const;
};

}  // namespace pecs::game
