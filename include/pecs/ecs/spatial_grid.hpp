#pragma once

/// @file spatial_grid.hpp
/// @brief Uniform-grid spatial partitioning over bounded 2D world space.
///
/// SpatialGrid divides the world rectangle into square cells and indexes
/// every entity carrying a "position" component in the one cell that
/// contains it.  Positions outside the bounds are clamped to the border
/// cells.  Queries first collect candidate cells, then filter exactly
/// against the stored positions.

#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pecs/ecs/entity.hpp"
#include "pecs/foundation/game_result.hpp"

namespace pecs::ecs {

/// Axis-aligned world rectangle.
struct WorldBounds {
    double minX = -10000.0;
    double minY = -10000.0;
    double maxX = 10000.0;
    double maxY = 10000.0;
};

/// Grid construction parameters.
struct SpatialConfig {
    double cellSize = 100.0;
    WorldBounds bounds;
};

/// Zero-based grid cell coordinate.
struct CellCoord {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const CellCoord&) const = default;
};

}  // namespace pecs::ecs

template <>
struct std::hash<pecs::ecs::CellCoord> {
    std::size_t operator()(const pecs::ecs::CellCoord& c) const noexcept {
        auto h1 = std::hash<int32_t>{}(c.x);
        auto h2 = std::hash<int32_t>{}(c.y);
        return h1 ^ (h2 * 2654435761u);
    }
};

namespace pecs::ecs {

/// Unordered pair of entity ids with `first < second`.
using EntityIdPair = std::pair<EntityId, EntityId>;

/// Grid-based spatial index.
///
/// The grid is sparse: only occupied cells are stored.  The index does not
/// watch entities; callers must Update/Remove at the right lifecycle
/// points (the World does this for "position" component changes).
///
/// Thread safety: None.
class SpatialGrid {
public:
    /// Build a grid.
    /// @return InvalidCellSize if `cellSize <= 0`, InvalidWorldBounds if
    ///         the bounds are empty or inverted.
    [[nodiscard]] static foundation::GameResult<SpatialGrid> Create(const SpatialConfig& config);

    // -- Mutation -------------------------------------------------------

    /// Index @p entity at its "position" component.
    /// @return false (and index nothing) when the component is missing.
    bool InsertEntity(const EntityPtr& entity);

    /// Index @p entity at an explicit position, replacing any previous
    /// entry for the same id.
    void Insert(const EntityPtr& entity, double x, double y);

    /// Remove the entry for @p id.  No-op if not indexed.
    /// @return true if an entry was removed.
    bool RemoveEntity(EntityId id);

    /// Remove then re-insert from the current "position" component.
    bool UpdateEntity(const EntityPtr& entity);

    /// Remove all entries.
    void Clear();

    // -- Queries --------------------------------------------------------

    /// Entities whose position lies within @p radius of (x, y), ordered
    /// by id.  A radius of zero matches entities exactly at the point.
    [[nodiscard]] std::vector<EntityPtr>
    GetEntitiesInRadius(double x, double y, double radius) const;

    /// Entities whose position lies in the rectangle [x, x+width] x
    /// [y, y+height] (inclusive), ordered by id.
    [[nodiscard]] std::vector<EntityPtr>
    GetEntitiesInRect(double x, double y, double width, double height) const;

    /// Entities in the cell at grid coordinate @p cell.
    [[nodiscard]] std::vector<EntityPtr> GetEntitiesInCell(CellCoord cell) const;

    /// Unique pairs of entities sharing a cell, sorted ascending.
    ///
    /// This is a broad phase: sharing a cell does not imply overlap.
    [[nodiscard]] std::vector<EntityIdPair> GetPotentialCollisionPairs() const;

    // -- Accessors ------------------------------------------------------

    /// Cell containing world position (x, y), clamped to the grid.
    [[nodiscard]] CellCoord WorldToCell(double x, double y) const noexcept;

    [[nodiscard]] bool Contains(EntityId id) const { return entries_.contains(id); }
    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    [[nodiscard]] double CellSize() const noexcept { return cellSize_; }
    [[nodiscard]] const WorldBounds& Bounds() const noexcept { return bounds_; }
    [[nodiscard]] int32_t Width() const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }

private:
    struct Entry {
        EntityPtr entity;
        CellCoord cell;
        double x = 0.0;
        double y = 0.0;
    };

    SpatialGrid(double cellSize, const WorldBounds& bounds, int32_t width, int32_t height);

    /// Collect entries of every cell in [lo, hi] passing @p accept.
    template <typename Pred>
    std::vector<EntityPtr> collect(CellCoord lo, CellCoord hi, Pred accept) const;

    double cellSize_;
    WorldBounds bounds_;
    int32_t width_;
    int32_t height_;

    /// cell coord -> ids in that cell.
    std::unordered_map<CellCoord, std::vector<EntityId>> cells_;

    /// id -> indexed entity, its cell and position.
    std::unordered_map<EntityId, Entry> entries_;
};

}  // namespace pecs::ecs
