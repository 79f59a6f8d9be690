/// @file world.cpp
/// @brief World construction, frame driver and lifecycle events.

#include "pecs/ecs/world.hpp"

#include <cmath>
#include <string>

#include "pecs/ecs/serialization.hpp"
#include "pecs/foundation/game_logger.hpp"
#include "pecs/game/collision_system.hpp"
#include "pecs/game/physics_system.hpp"

namespace pecs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kPositionKind = "position";

EventData templateEvent(EntityPtr entity, std::string_view name,
                        const ComponentSet& overrides) {
    EventData data;
    data.entity = std::move(entity);
    data.fields.emplace("templateName", Value(name));
    if (!overrides.empty()) {
        data.fields.emplace("overrides", componentsToValue(overrides));
    }
    return data;
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────────

GameResult<std::unique_ptr<World>> World::Create(const WorldConfig& config) {
    auto grid = SpatialGrid::Create(config.spatial);
    if (!grid) {
        PECS_LOG_ERROR(LogCategory::Core,
                       "world creation failed: " + grid.error().describe());
        return GameResult<std::unique_ptr<World>>::err(grid.error());
    }

    if (config.collision.useSpatialGrid) {
        auto broadPhase = SpatialGrid::Create({config.collision.cellSize, config.collision.bounds});
        if (!broadPhase) {
            PECS_LOG_ERROR(LogCategory::Core,
                           "world creation failed, collision grid: " +
                               broadPhase.error().describe());
            return GameResult<std::unique_ptr<World>>::err(broadPhase.error());
        }
    }

    if (config.logLevel) {
        foundation::GameLogger::instance().setAllCategoryLevels(*config.logLevel);
    }

    auto world = std::make_unique<World>(CreateKey{}, config, std::move(grid).value());
    if (config.registerDefaultSystems) {
        world->registerDefaultSystems();
    }
    PECS_LOG_DEBUG(LogCategory::Core,
                   "world created, " + std::to_string(world->systems_.SystemCount()) + " systems");
    return GameResult<std::unique_ptr<World>>::ok(std::move(world));
}

World::World(CreateKey, WorldConfig config, SpatialGrid grid)
    : config_(std::move(config)),
      grid_(std::move(grid)),
      entities_(&bus_) {
    entities_.SetObserver(this);
}

World::~World() {
    entities_.SetObserver(nullptr);
}

void World::registerDefaultSystems() {
    Register<game::CollisionSystem>(config_.collision);
    Register<game::PhysicsSystem>(config_.physics);
}

// ── Frame ───────────────────────────────────────────────────────────────

void World::Update(double deltaTime) {
    if (!(deltaTime > 0.0) || !std::isfinite(deltaTime)) {
        PECS_LOG_WARN(LogCategory::Core,
                      "ignoring update with delta " + std::to_string(deltaTime));
        return;
    }
    systems_.Update(deltaTime, entities_);
    entities_.Cleanup();
    bus_.ProcessEvents();
}

void World::Draw() {
    systems_.Draw(entities_);
}

// ── Entities ────────────────────────────────────────────────────────────

EntityPtr World::CreateEntity() {
    auto entity = entities_.CreateEntity();
    bus_.Emit("entityCreated", EventData{entity, nullptr, {}, {}});
    return entity;
}

bool World::AddEntity(const EntityPtr& entity) {
    if (!entities_.AddEntity(entity)) {
        return false;
    }
    grid_.InsertEntity(entity);
    return true;
}

bool World::RemoveEntity(const EntityPtr& entity) {
    return entities_.RemoveEntity(entity);
}

bool World::UpdateEntityPosition(const EntityPtr& entity) {
    return grid_.UpdateEntity(entity);
}

// ── Templates ───────────────────────────────────────────────────────────

GameResult<void> World::RegisterTemplate(std::string_view name, ComponentSet components) {
    auto result = templates_.Register(name, std::move(components));
    if (result) {
        EventData data;
        data.fields.emplace("name", Value(name));
        bus_.Emit("templateRegistered", std::move(data));
    }
    return result;
}

GameResult<void> World::ExtendTemplate(std::string_view baseName, std::string_view newName,
                                       const ComponentSet& additional,
                                       const ComponentSet& overrides) {
    auto result = templates_.Extend(baseName, newName, additional, overrides);
    if (result) {
        EventData data;
        data.fields.emplace("baseName", Value(baseName));
        data.fields.emplace("newName", Value(newName));
        bus_.Emit("templateExtended", std::move(data));
    }
    return result;
}

GameResult<EntityPtr> World::CreateEntityFromTemplate(std::string_view name,
                                                      const ComponentSet& overrides) {
    if (!templates_.Exists(name)) {
        PECS_LOG_WARN(LogCategory::Template,
                      "cannot create entity, unknown template: " + std::string(name));
        return GameResult<EntityPtr>::err(
            GameError(ErrorCode::TemplateNotFound,
                      "component template does not exist: " + std::string(name)));
    }

    bus_.Emit("entityTemplateCreating", templateEvent(nullptr, name, overrides));
    auto entity = CreateEntity();
    auto applied = templates_.Apply(*entity, name, overrides);
    if (!applied) {
        entities_.RemoveEntity(entity);
        return GameResult<EntityPtr>::err(applied.error());
    }
    bus_.Emit("entityTemplateCreated", templateEvent(entity, name, overrides));
    return GameResult<EntityPtr>::ok(std::move(entity));
}

GameResult<void> World::ApplyTemplate(const EntityPtr& entity, std::string_view name,
                                      const ComponentSet& overrides) {
    if (!entity) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot apply a template to a null entity"));
    }
    if (!templates_.Exists(name)) {
        return GameResult<void>::err(
            GameError(ErrorCode::TemplateNotFound,
                      "component template does not exist: " + std::string(name)));
    }

    bus_.Emit("entityTemplateApplying", templateEvent(entity, name, overrides));
    auto applied = templates_.Apply(*entity, name, overrides);
    if (!applied) {
        return applied;
    }
    bus_.Emit("entityTemplateApplied", templateEvent(entity, name, overrides));
    return GameResult<void>::ok();
}

std::vector<EntityPtr> World::GetEntitiesFromTemplate(std::string_view name) const {
    return entities_.GetEntitiesWithTag(TemplateRegistry::TemplateTag(name));
}

// ── Pools ───────────────────────────────────────────────────────────────

EntityPtr World::GetPooledEntity(std::string_view poolName) {
    bool fromPool = false;
    auto entity = entities_.GetPooledEntity(poolName, &fromPool);

    EventData data;
    data.entity = entity;
    data.fields.emplace("fromPool", Value(fromPool));
    data.fields.emplace("poolName", Value(poolName));
    bus_.Emit("entityCreated", std::move(data));
    return entity;
}

bool World::ReturnToPool(const EntityPtr& entity) {
    if (!entity) {
        return false;
    }
    grid_.RemoveEntity(entity->Id());
    if (!entities_.ReturnToPool(entity)) {
        return false;
    }
    bus_.Emit("entityReturnedToPool", EventData{entity, nullptr, {}, {}});
    return true;
}

// ── Systems ─────────────────────────────────────────────────────────────

void World::emitSystemAdded(const System& system) {
    EventData data;
    data.fields.emplace("name", Value(system.GetName()));
    data.fields.emplace("priority", Value(system.GetPriority()));
    bus_.Emit("systemAdded", std::move(data));
}

System& World::AddSystem(std::unique_ptr<System> system) {
    System& added = systems_.Add(std::move(system));
    emitSystemAdded(added);
    return added;
}

System& World::CreateSystem(std::string name, int priority,
                            std::vector<std::string> requiredComponents) {
    System& created = systems_.Add(
        std::make_unique<System>(std::move(name), priority, std::move(requiredComponents)));

    EventData data;
    data.fields.emplace("name", Value(created.GetName()));
    bus_.Emit("systemCreated", std::move(data));
    return created;
}

// ── Persistence ─────────────────────────────────────────────────────────

WorldSnapshot World::Serialize() const {
    return SerializeWorld(*this);
}

GameResult<void> World::SaveToFile(const std::filesystem::path& path) {
    auto saved = SaveWorldToFile(*this, path);

    EventData data;
    data.fields.emplace("filename", Value(path.string()));
    if (saved) {
        bus_.Emit("worldSaved", std::move(data));
    } else {
        data.fields.emplace("error", Value(saved.error().describe()));
        bus_.Emit("worldSaveFailed", std::move(data));
    }
    return saved;
}

// ── Grid synchronization ────────────────────────────────────────────────

void World::onComponentAdded(Entity& entity, std::string_view kind) {
    if (kind == kPositionKind) {
        grid_.InsertEntity(entity.shared_from_this());
    }
}

void World::onComponentRemoved(Entity& entity, std::string_view kind) {
    if (kind == kPositionKind) {
        grid_.RemoveEntity(entity.Id());
    }
}

void World::onReset(Entity& entity, const TagSet& /*oldTags*/,
                    const ComponentSet& oldComponents) {
    if (oldComponents.contains(kPositionKind)) {
        grid_.RemoveEntity(entity.Id());
    }
}

void World::onRemoved(Entity& entity) {
    grid_.RemoveEntity(entity.Id());
}

}  // namespace pecs::ecs
