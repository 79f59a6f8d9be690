/// @file collision_system.cpp
/// @brief AABB narrow phase, grid broad phase and contact dispatch.

#include "pecs/game/collision_system.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "pecs/ecs/entity_manager.hpp"
#include "pecs/ecs/event_bus.hpp"
#include "pecs/ecs/spatial_grid.hpp"
#include "pecs/foundation/game_logger.hpp"

namespace pecs::game {

using ecs::Entity;
using ecs::EntityManager;
using ecs::EntityPtr;
using ecs::EventData;
using ecs::Value;
using foundation::LogCategory;

// ── Geometry ────────────────────────────────────────────────────────────

std::optional<CollisionData> ComputeCollision(const Aabb& a, const Aabb& b) noexcept {
    if (!a.Intersects(b)) {
        return std::nullopt;
    }

    const double dx = a.Center().x - b.Center().x;
    const double dy = a.Center().y - b.Center().y;
    const double px = (a.width + b.width) / 2.0 - std::abs(dx);
    const double py = (a.height + b.height) / 2.0 - std::abs(dy);

    Vector2 normal;
    if (px < py) {
        normal.x = dx < 0.0 ? -1.0 : 1.0;
    } else {
        normal.y = dy < 0.0 ? -1.0 : 1.0;
    }

    CollisionData data;
    data.normal = normal;
    data.penetration = {px * normal.x, py * normal.y};
    data.point = {dx < 0.0 ? a.x + a.width : b.x, dy < 0.0 ? a.y + a.height : b.y};
    data.fromAbove = normal.y < 0.0;
    return data;
}

Aabb ColliderBox(const Transform& transform, const Collider& collider) noexcept {
    const double w = collider.width > 0.0 ? collider.width : transform.width;
    const double h = collider.height > 0.0 ? collider.height : transform.height;
    return Aabb{transform.x + collider.offsetX, transform.y + collider.offsetY,
                std::max(0.0, w), std::max(0.0, h)};
}

bool LayersCompatible(const Collider& a, const Collider& b) {
    return a.CollidesWith(b.layer) || b.CollidesWith(a.layer);
}

// ── CollisionSystem ─────────────────────────────────────────────────────

CollisionSystem::CollisionSystem(CollisionSettings settings)
    : System(kName, kPriority,
             {std::string(kinds::kTransform), std::string(kinds::kCollider)}),
      settings_(settings) {}

void CollisionSystem::Update(double /*deltaTime*/, EntityManager& manager) {
    stats_ = {};
    const auto entities = manager.GetEntitiesWith(RequiredComponents());

    if (settings_.useSpatialGrid) {
        for (const auto& [i, j] : broadPhase(entities)) {
            testPair(manager, entities[i], entities[j]);
        }
    } else {
        for (std::size_t i = 0; i < entities.size(); ++i) {
            for (std::size_t j = i + 1; j < entities.size(); ++j) {
                testPair(manager, entities[i], entities[j]);
            }
        }
    }

    if (stats_.contacts > 0) {
        PECS_LOG_DEBUG(LogCategory::Collision,
                       std::to_string(stats_.contacts) + " contacts from " +
                           std::to_string(stats_.pairsTested) + " pairs");
    }
}

std::vector<std::pair<std::size_t, std::size_t>>
CollisionSystem::broadPhase(const std::vector<EntityPtr>& entities) const {
    std::vector<std::pair<std::size_t, std::size_t>> pairs;

    auto gridResult = ecs::SpatialGrid::Create({settings_.cellSize, settings_.bounds});
    if (!gridResult) {
        PECS_LOG_WARN(LogCategory::Collision,
                      "broad-phase grid unavailable, testing all pairs: " +
                          gridResult.error().describe());
        for (std::size_t i = 0; i < entities.size(); ++i) {
            for (std::size_t j = i + 1; j < entities.size(); ++j) {
                pairs.emplace_back(i, j);
            }
        }
        return pairs;
    }
    auto& grid = gridResult.value();

    // Each box is indexed at its top-left corner.  A box overlapping box A
    // has its corner inside A grown up and left by the largest extent.
    std::vector<std::optional<Aabb>> boxes(entities.size());
    std::unordered_map<ecs::EntityId, std::size_t> indexOf;
    double maxW = 0.0;
    double maxH = 0.0;
    for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto* transform = entities[i]->GetComponent(kinds::kTransform);
        const auto* collider = entities[i]->GetComponent(kinds::kCollider);
        if (transform == nullptr || collider == nullptr) {
            continue;
        }
        Aabb box = ColliderBox(Transform::FromData(*transform), Collider::FromData(*collider));
        boxes[i] = box;
        maxW = std::max(maxW, box.width);
        maxH = std::max(maxH, box.height);
        grid.Insert(entities[i], box.x, box.y);
        indexOf.emplace(entities[i]->Id(), i);
    }

    for (std::size_t i = 0; i < entities.size(); ++i) {
        if (!boxes[i]) {
            continue;
        }
        const Aabb& box = *boxes[i];
        for (const auto& candidate :
             grid.GetEntitiesInRect(box.x - maxW, box.y - maxH, box.width + maxW,
                                    box.height + maxH)) {
            const std::size_t j = indexOf.at(candidate->Id());
            if (j > i) {
                pairs.emplace_back(i, j);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

void CollisionSystem::testPair(EntityManager& manager, const EntityPtr& a, const EntityPtr& b) {
    // Hooks of earlier pairs may have deactivated or reshaped either side.
    if (!a->IsActive() || !b->IsActive()) {
        return;
    }
    const auto* transformA = a->GetComponent(kinds::kTransform);
    const auto* colliderDataA = a->GetComponent(kinds::kCollider);
    const auto* transformB = b->GetComponent(kinds::kTransform);
    const auto* colliderDataB = b->GetComponent(kinds::kCollider);
    if (!transformA || !colliderDataA || !transformB || !colliderDataB) {
        return;
    }
    ++stats_.pairsTested;

    const auto colliderA = Collider::FromData(*colliderDataA);
    const auto colliderB = Collider::FromData(*colliderDataB);
    if (!LayersCompatible(colliderA, colliderB)) {
        return;
    }

    auto contact = ComputeCollision(ColliderBox(Transform::FromData(*transformA), colliderA),
                                    ColliderBox(Transform::FromData(*transformB), colliderB));
    if (!contact) {
        return;
    }
    ++stats_.contacts;

    dispatch(manager, a, b, *contact);

    if (settings_.resolveGrounding) {
        resolveGrounding(*a, colliderB, colliderA.isTrigger, *contact);
        resolveGrounding(*b, colliderA, colliderB.isTrigger, contact->Flipped());
    }
}

void CollisionSystem::dispatch(EntityManager& manager, const EntityPtr& a, const EntityPtr& b,
                               const CollisionData& data) {
    const auto* typeDataA = a->GetComponent(kinds::kType);
    const auto* typeDataB = b->GetComponent(kinds::kType);
    const std::string typeA = typeDataA ? TypeInfo::FromData(*typeDataA).name : "entity";
    const std::string typeB = typeDataB ? TypeInfo::FromData(*typeDataB).name : "entity";

    if (auto* bus = manager.Bus()) {
        auto makeEvent = [&] {
            EventData event;
            event.entity = a;
            event.other = b;
            event.fields = {{"typeA", Value(typeA)}, {"typeB", Value(typeB)}};
            event.context = data;
            return event;
        };
        bus->Emit("collision", makeEvent());
        bus->Emit("collision:" + typeA, makeEvent());
        bus->Emit("collision:" + typeA + ":" + typeB, makeEvent());
    }

    // Handlers are held by copy: a hook may replace its own slot.
    if (auto handler = a->GetCollisionHandler()) {
        handler->OnCollision(*a, *b, data);
    }
    if (auto handler = b->GetCollisionHandler()) {
        handler->OnCollision(*b, *a, data.Flipped());
    }
}

void CollisionSystem::resolveGrounding(Entity& entity, const Collider& other, bool selfTrigger,
                                       const CollisionData& data) {
    if (!data.fromAbove || selfTrigger || other.isTrigger || !other.isSolid) {
        return;
    }
    auto* physics = entity.GetComponent(kinds::kPhysics);
    if (physics == nullptr) {
        return;
    }
    ecs::setField(*physics, "isGrounded", true);
    if (ecs::getNumber(*physics, "velocityY") > 0.0) {
        ecs::setField(*physics, "velocityY", 0.0);
    }
}

}  // namespace pecs::game
