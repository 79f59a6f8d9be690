/// @file world_config.cpp
/// @brief ConfigManager -> WorldConfig mapping.

#include "pecs/ecs/world_config.hpp"

#include <string>
#include <string_view>

namespace pecs::ecs {

using foundation::ConfigManager;
using foundation::GameResult;

namespace {

/// Overwrite @p out with the value at @p key when present.
template <typename T>
GameResult<void> readKey(const ConfigManager& config, std::string_view key, T& out) {
    auto result = config.getOr<T>(key, out);
    if (!result) {
        return GameResult<void>::err(result.error());
    }
    out = result.value();
    return GameResult<void>::ok();
}

}  // namespace

GameResult<WorldConfig> LoadWorldConfig(const ConfigManager& config) {
    WorldConfig wc;
    auto& bounds = wc.spatial.bounds;

    GameResult<void> steps[] = {
        readKey(config, "world.spatial.cellSize", wc.spatial.cellSize),
        readKey(config, "world.spatial.bounds.minX", bounds.minX),
        readKey(config, "world.spatial.bounds.minY", bounds.minY),
        readKey(config, "world.spatial.bounds.maxX", bounds.maxX),
        readKey(config, "world.spatial.bounds.maxY", bounds.maxY),
        readKey(config, "world.registerDefaultSystems", wc.registerDefaultSystems),
        readKey(config, "physics.gravity", wc.physics.gravity),
        readKey(config, "physics.terminalVelocity", wc.physics.terminalVelocity),
        readKey(config, "physics.frictionEpsilon", wc.physics.frictionEpsilon),
        readKey(config, "collision.useSpatialGrid", wc.collision.useSpatialGrid),
        readKey(config, "collision.cellSize", wc.collision.cellSize),
        readKey(config, "collision.resolveGrounding", wc.collision.resolveGrounding),
    };
    for (auto& step : steps) {
        if (!step) {
            return GameResult<WorldConfig>::err(step.error());
        }
    }

    if (config.hasKey("physics.dampening")) {
        auto dampening = config.get<double>("physics.dampening");
        if (!dampening) {
            return GameResult<WorldConfig>::err(dampening.error());
        }
        wc.physics.dampening = dampening.value();
    }

    if (config.hasKey("logging.level")) {
        auto text = config.get<std::string>("logging.level");
        if (!text) {
            return GameResult<WorldConfig>::err(text.error());
        }
        wc.logLevel = foundation::parseLogLevel(text.value());
        if (!wc.logLevel) {
            return GameResult<WorldConfig>::err(
                foundation::GameError(foundation::ErrorCode::InvalidArgument,
                                      "unknown log level: " + text.value()));
        }
    }

    wc.collision.bounds = wc.spatial.bounds;
    return GameResult<WorldConfig>::ok(wc);
}

}  // namespace pecs::ecs
