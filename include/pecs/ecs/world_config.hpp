#pragma once

/// @file world_config.hpp
/// @brief World construction settings and their YAML mapping.
///
/// Recognized keys (all optional):
/// | Key                                        | Default          |
/// |--------------------------------------------|------------------|
/// | world.spatial.cellSize                     | 100              |
/// | world.spatial.bounds.minX/minY/maxX/maxY   | -10000 .. 10000  |
/// | world.registerDefaultSystems               | true             |
/// | physics.gravity                            | 400              |
/// | physics.terminalVelocity                   | 1000             |
/// | physics.frictionEpsilon                    | 0.1              |
/// | physics.dampening                          | unset            |
/// | collision.useSpatialGrid                   | false            |
/// | collision.cellSize                         | 64               |
/// | collision.resolveGrounding                 | true             |
/// | logging.level                              | unset            |

#include <optional>

#include "pecs/ecs/spatial_grid.hpp"
#include "pecs/foundation/config_manager.hpp"
#include "pecs/foundation/game_logger.hpp"
#include "pecs/foundation/game_result.hpp"
#include "pecs/game/collision_types.hpp"
#include "pecs/game/physics_system.hpp"

namespace pecs::ecs {

struct WorldConfig {
    SpatialConfig spatial;

    /// Register CollisionSystem and PhysicsSystem on creation.
    bool registerDefaultSystems = true;

    game::PhysicsSettings physics;

    /// `bounds` is taken from `spatial.bounds` by LoadWorldConfig().
    game::CollisionSettings collision;

    /// Minimum level applied to every log category by World::Create().
    std::optional<foundation::LogLevel> logLevel;
};

/// Build a WorldConfig from @p config, using defaults for absent keys.
/// @return ConfigTypeMismatch if a present key has the wrong type,
///         InvalidArgument for an unknown `logging.level`.
[[nodiscard]] foundation::GameResult<WorldConfig>
LoadWorldConfig(const foundation::ConfigManager& config);

}  // namespace pecs::ecs
