#pragma once

/// @file collision_types.hpp
/// @brief Contact data and settings for AABB collision detection.

#include <cstddef>
#include <optional>

#include "pecs/ecs/spatial_grid.hpp"
#include "pecs/game/components.hpp"
#include "pecs/game/math_types.hpp"

namespace pecs::game {

/// Narrow-phase contact between two boxes, seen from the first box.
struct CollisionData {
    /// Unit axis vector along the axis of minimum penetration, pointing
    /// from the second box toward the first.
    Vector2 normal;

    /// Signed depth per axis: `(px * normal.x, py * normal.y)`.
    Vector2 penetration;

    /// Deterministic contact corner.
    Vector2 point;

    /// True when the first box rests on top of the second (normal.y < 0).
    bool fromAbove = false;

    /// The same contact seen from the second box: normal and penetration
    /// negated, same point, fromAbove recomputed for the new side.
    [[nodiscard]] CollisionData Flipped() const noexcept {
        return CollisionData{-normal, -penetration, point, normal.y > 0.0};
    }
};

/// Compute the contact of @p a against @p b, or nullopt if they do not
/// overlap.  Equal penetration on both axes resolves vertically.
[[nodiscard]] std::optional<CollisionData> ComputeCollision(const Aabb& a, const Aabb& b) noexcept;

/// World-space box of a collider attached to a transform.
[[nodiscard]] Aabb ColliderBox(const Transform& transform, const Collider& collider) noexcept;

/// True if either collider lists the other's layer.
[[nodiscard]] bool LayersCompatible(const Collider& a, const Collider& b);

/// CollisionSystem tuning.
struct CollisionSettings {
    /// Use a uniform grid for the broad phase instead of testing all pairs.
    bool useSpatialGrid = false;

    /// Cell size of the broad-phase grid.
    double cellSize = 64.0;

    /// Extent of the broad-phase grid.
    ecs::WorldBounds bounds;

    /// Mark physics bodies grounded when they rest on a solid collider.
    bool resolveGrounding = true;
};

/// Counters for the last update pass.
struct CollisionStats {
    std::size_t pairsTested = 0;
    std::size_t contacts = 0;
};

}  // namespace pecs::game
