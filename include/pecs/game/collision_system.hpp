#pragma once

/// @file collision_system.hpp
/// @brief AABB collision detection and contact dispatch.
///
/// CollisionSystem tests every pair of active entities carrying transform
/// and collider (i < j in query order), filters by layer, and for each
/// overlap:
///   1. queues "collision", "collision:<typeA>" and
///      "collision:<typeA>:<typeB>" on the world's EventBus;
///   2. calls A's CollisionHandler with the contact, then B's with the
///      flipped contact;
///   3. optionally grounds a physics body resting on a solid collider.
///
/// Contacts are reported every frame they persist.  Runs at priority 10,
/// before PhysicsSystem, so grounding is not overwritten by integration.

#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/system.hpp"
#include "pecs/game/collision_types.hpp"

#include <string>
#include <vector>

namespace pecs::game {

class CollisionSystem : public ecs::System {
public:
    static constexpr int kPriority = 10;
    static constexpr const char* kName = "CollisionSystem";

    explicit CollisionSystem(CollisionSettings settings = {});

    void Update(double deltaTime, ecs::EntityManager& entities) override;

    [[nodiscard]] const CollisionSettings& Settings() const noexcept { return settings_; }
    void SetSettings(const CollisionSettings& settings) { settings_ = settings; }

    /// Counters of the last Update().
    [[nodiscard]] const CollisionStats& LastStats() const noexcept { return stats_; }

private:
    /// Candidate index pairs (i < j) in ascending order.
    [[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>>
    broadPhase(const std::vector<ecs::EntityPtr>& entities) const;

    void testPair(ecs::EntityManager& manager, const ecs::EntityPtr& a, const ecs::EntityPtr& b);

    void dispatch(ecs::EntityManager& manager, const ecs::EntityPtr& a, const ecs::EntityPtr& b,
                  const CollisionData& data);

    void resolveGrounding(ecs::Entity& entity, const Collider& other, bool selfTrigger,
                          const CollisionData& data);

    CollisionSettings settings_;
    CollisionStats stats_;
};

}  // namespace pecs::game
