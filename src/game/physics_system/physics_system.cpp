/// @file physics_system.cpp
/// @brief PhysicsSystem per-entity integration.

#include "pecs/game/physics_system.hpp"

#include <cmath>
#include <string>

#include "pecs/ecs/entity.hpp"
#include "pecs/game/components.hpp"

namespace pecs::game {

PhysicsSystem::PhysicsSystem(PhysicsSettings settings)
    : System(kName, kPriority,
             {std::string(kinds::kTransform), std::string(kinds::kPhysics)}),
      settings_(settings) {}

void PhysicsSystem::ProcessEntity(ecs::Entity& entity, double deltaTime) {
    auto* transformData = entity.GetComponent(kinds::kTransform);
    auto* physicsData = entity.GetComponent(kinds::kPhysics);
    if (transformData == nullptr || physicsData == nullptr) {
        return;
    }

    auto physics = Physics::FromData(*physicsData);
    if (physics.disabled) {
        return;
    }
    auto transform = Transform::FromData(*transformData);

    if (physics.affectedByGravity) {
        physics.velocityY += physics.gravity.value_or(settings_.gravity) * deltaTime;
        if (physics.velocityY > settings_.terminalVelocity) {
            physics.velocityY = settings_.terminalVelocity;
        }
    }

    if (physics.isGrounded && physics.friction) {
        physics.velocityX *= 1.0 - *physics.friction;
        if (std::abs(physics.velocityX) < settings_.frictionEpsilon) {
            physics.velocityX = 0.0;
        }
    }

    if (!physics.isGrounded && physics.airResistance) {
        physics.velocityX *= 1.0 - *physics.airResistance;
    }

    transform.x += physics.velocityX * deltaTime;
    transform.y += physics.velocityY * deltaTime;

    physics.isGrounded = false;

    if (auto dampening = physics.dampening ? physics.dampening : settings_.dampening) {
        physics.velocityX *= *dampening;
        physics.velocityY *= *dampening;
    }

    ecs::setField(*transformData, "x", transform.x);
    ecs::setField(*transformData, "y", transform.y);
    ecs::setField(*physicsData, "velocityX", physics.velocityX);
    ecs::setField(*physicsData, "velocityY", physics.velocityY);
    ecs::setField(*physicsData, "isGrounded", physics.isGrounded);
}

}  // namespace pecs::game
