#pragma once

/// @file physics_system.hpp
/// @brief Velocity, gravity and friction integration.

#include "pecs/ecs/system.hpp"

#include <optional>

namespace pecs::game {

/// PhysicsSystem tuning.
struct PhysicsSettings {
    /// Gravity for bodies without their own `physics.gravity`.
    double gravity = 400.0;

    /// Cap for downward velocity.
    double terminalVelocity = 1000.0;

    /// Grounded horizontal speed below this snaps to zero.
    double frictionEpsilon = 0.1;

    /// Velocity multiplier for bodies without their own `physics.dampening`.
    std::optional<double> dampening;
};

/// Integrates `physics` velocity into `transform` position.
///
/// Per active entity carrying transform and physics, unless
/// `physics.disabled`:
///   1. if `affectedByGravity`, add gravity * dt to velocityY, capped at
///      the terminal velocity;
///   2. if grounded and `friction` is set, scale velocityX by
///      (1 - friction), snapping to zero below the epsilon;
///   3. if airborne and `airResistance` is set, scale velocityX by
///      (1 - airResistance);
///   4. move the transform by velocity * dt;
///   5. clear `isGrounded` (CollisionSystem sets it again next frame);
///   6. multiply both velocity axes by the dampening, if any.
///
/// Runs at priority 20, after CollisionSystem.
class PhysicsSystem : public ecs::System {
public:
    static constexpr int kPriority = 20;
    static constexpr const char* kName = "PhysicsSystem";

    explicit PhysicsSystem(PhysicsSettings settings = {});

    void ProcessEntity(ecs::Entity& entity, double deltaTime) override;

    [[nodiscard]] const PhysicsSettings& Settings() const noexcept { return settings_; }
    void SetSettings(const PhysicsSettings& settings) { settings_ = settings; }

private:
    PhysicsSettings settings_;
};

}  // namespace pecs::game
