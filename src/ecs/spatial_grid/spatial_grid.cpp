/// @file spatial_grid.cpp
/// @brief Uniform-grid spatial index implementation.

#include "pecs/ecs/spatial_grid.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "pecs/ecs/value.hpp"

namespace pecs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

bool byId(const EntityPtr& a, const EntityPtr& b) {
    return a->Id() < b->Id();
}

}  // namespace

GameResult<SpatialGrid> SpatialGrid::Create(const SpatialConfig& config) {
    if (!(config.cellSize > 0.0) || !std::isfinite(config.cellSize)) {
        return GameResult<SpatialGrid>::err(
            GameError(ErrorCode::InvalidCellSize,
                      "cell size must be positive, got " + std::to_string(config.cellSize)));
    }
    const auto& b = config.bounds;
    if (!(b.maxX > b.minX) || !(b.maxY > b.minY)) {
        return GameResult<SpatialGrid>::err(
            GameError(ErrorCode::InvalidWorldBounds,
                      "world bounds must satisfy min < max on both axes"));
    }
    if (!std::isfinite(b.maxX - b.minX) || !std::isfinite(b.maxY - b.minY)) {
        return GameResult<SpatialGrid>::err(
            GameError(ErrorCode::InvalidWorldBounds, "world bounds must be finite"));
    }
    const double columns = std::ceil((b.maxX - b.minX) / config.cellSize);
    const double rows = std::ceil((b.maxY - b.minY) / config.cellSize);
    constexpr auto kMaxCells = static_cast<double>(std::numeric_limits<int32_t>::max());
    if (columns > kMaxCells || rows > kMaxCells) {
        return GameResult<SpatialGrid>::err(
            GameError(ErrorCode::InvalidCellSize,
                      "cell size " + std::to_string(config.cellSize) +
                          " gives more cells per axis than a grid can address"));
    }
    return GameResult<SpatialGrid>::ok(SpatialGrid(config.cellSize, b,
                                                   static_cast<int32_t>(columns),
                                                   static_cast<int32_t>(rows)));
}

SpatialGrid::SpatialGrid(double cellSize, const WorldBounds& bounds,
                         int32_t width, int32_t height)
    : cellSize_(cellSize), bounds_(bounds), width_(width), height_(height) {}

// -- Mutation -----------------------------------------------------------------

bool SpatialGrid::InsertEntity(const EntityPtr& entity) {
    if (!entity) {
        return false;
    }
    const auto* position = entity->GetComponent("position");
    if (position == nullptr) {
        return false;
    }
    Insert(entity, getNumber(*position, "x"), getNumber(*position, "y"));
    return true;
}

void SpatialGrid::Insert(const EntityPtr& entity, double x, double y) {
    RemoveEntity(entity->Id());
    auto cell = WorldToCell(x, y);
    cells_[cell].push_back(entity->Id());
    entries_.emplace(entity->Id(), Entry{entity, cell, x, y});
}

bool SpatialGrid::RemoveEntity(EntityId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    auto cellIt = cells_.find(it->second.cell);
    if (cellIt != cells_.end()) {
        std::erase(cellIt->second, id);
        if (cellIt->second.empty()) {
            cells_.erase(cellIt);
        }
    }
    entries_.erase(it);
    return true;
}

bool SpatialGrid::UpdateEntity(const EntityPtr& entity) {
    if (!entity) {
        return false;
    }
    RemoveEntity(entity->Id());
    return InsertEntity(entity);
}

void SpatialGrid::Clear() {
    cells_.clear();
    entries_.clear();
}

// -- Queries ------------------------------------------------------------------

template <typename Pred>
std::vector<EntityPtr> SpatialGrid::collect(CellCoord lo, CellCoord hi, Pred accept) const {
    std::vector<EntityPtr> result;
    for (int32_t cy = lo.y; cy <= hi.y; ++cy) {
        for (int32_t cx = lo.x; cx <= hi.x; ++cx) {
            auto it = cells_.find(CellCoord{cx, cy});
            if (it == cells_.end()) {
                continue;
            }
            for (auto id : it->second) {
                const auto& entry = entries_.at(id);
                if (accept(entry)) {
                    result.push_back(entry.entity);
                }
            }
        }
    }
    std::sort(result.begin(), result.end(), byId);
    return result;
}

std::vector<EntityPtr> SpatialGrid::GetEntitiesInRadius(double x, double y, double radius) const {
    if (radius < 0.0) {
        return {};
    }
    const double radiusSq = radius * radius;
    return collect(WorldToCell(x - radius, y - radius), WorldToCell(x + radius, y + radius),
                   [&](const Entry& e) {
                       const double dx = e.x - x;
                       const double dy = e.y - y;
                       return dx * dx + dy * dy <= radiusSq;
                   });
}

std::vector<EntityPtr> SpatialGrid::GetEntitiesInRect(double x, double y,
                                                      double width, double height) const {
    if (width < 0.0 || height < 0.0) {
        return {};
    }
    return collect(WorldToCell(x, y), WorldToCell(x + width, y + height),
                   [&](const Entry& e) {
                       return e.x >= x && e.x <= x + width && e.y >= y && e.y <= y + height;
                   });
}

std::vector<EntityPtr> SpatialGrid::GetEntitiesInCell(CellCoord cell) const {
    return collect(cell, cell, [](const Entry&) { return true; });
}

std::vector<EntityIdPair> SpatialGrid::GetPotentialCollisionPairs() const {
    std::vector<EntityIdPair> pairs;
    for (const auto& [cell, ids] : cells_) {
        for (std::size_t i = 0; i < ids.size(); ++i) {
            for (std::size_t j = i + 1; j < ids.size(); ++j) {
                pairs.emplace_back(std::min(ids[i], ids[j]), std::max(ids[i], ids[j]));
            }
        }
    }
    // An entity lives in exactly one cell, so pairs are already unique.
    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

// -- Accessors ----------------------------------------------------------------

CellCoord SpatialGrid::WorldToCell(double x, double y) const noexcept {
    // Clamp in floating point so far-out positions cannot overflow the cast.
    const double cx = std::floor((x - bounds_.minX) / cellSize_);
    const double cy = std::floor((y - bounds_.minY) / cellSize_);
    return {static_cast<int32_t>(std::clamp(cx, 0.0, static_cast<double>(width_ - 1))),
            static_cast<int32_t>(std::clamp(cy, 0.0, static_cast<double>(height_ - 1)))};
}

}  // namespace pecs::ecs
