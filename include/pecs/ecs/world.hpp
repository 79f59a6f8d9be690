#pragma once

/// @file world.hpp
/// @brief The World facade: one self-contained simulation.
///
/// A World owns its event bus, entity manager, system manager, spatial
/// grid and template registry.  Nothing is shared between worlds, so
/// several can run side by side (e.g. a level and its preview).
///
/// Frame order is fixed:
///   1. every active system's Update(), ascending priority
///   2. Cleanup() of inactive entities
///   3. ProcessEvents() on the bus
///
/// Usage:
/// @code
///   auto world = World::Create().value();
///   world->RegisterTemplate("crate", {{"transform", {...}}, {"physics", {...}}});
///   auto crate = world->CreateEntityFromTemplate("crate").value();
///   world->On("collision:crate", [](const EventData& e, double) { ... });
///   world->Update(1.0 / 60.0);
/// @endcode

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pecs/ecs/component_template.hpp"
#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/entity_manager.hpp"
#include "pecs/ecs/event_bus.hpp"
#include "pecs/ecs/spatial_grid.hpp"
#include "pecs/ecs/system.hpp"
#include "pecs/ecs/system_manager.hpp"
#include "pecs/ecs/world_config.hpp"
#include "pecs/foundation/game_result.hpp"

namespace pecs::ecs {

struct WorldSnapshot;

class World : private EntityObserver {
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    /// Build a world from @p config.
    ///
    /// @return InvalidCellSize / InvalidWorldBounds for a bad spatial or
    ///         collision grid configuration.
    [[nodiscard]] static foundation::GameResult<std::unique_ptr<World>>
    Create(const WorldConfig& config = {});

    /// Use Create(); the key keeps construction inside the factory.
    World(CreateKey, WorldConfig config, SpatialGrid grid);

    ~World() override;

    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = delete;
    World& operator=(World&&) = delete;

    // ── Frame ────────────────────────────────────────────────────────

    /// Advance one frame.  A non-positive or non-finite @p deltaTime is
    /// logged and ignored.
    void Update(double deltaTime);

    /// Run every active system's Draw() in priority order.
    void Draw();

    // ── Entities ─────────────────────────────────────────────────────

    /// Create an active entity.  Emits "entityCreated".
    EntityPtr CreateEntity();

    /// Register an entity built elsewhere and index its position.
    /// @return false if the id is already registered.
    bool AddEntity(const EntityPtr& entity);

    /// Remove @p entity immediately (outside the end-of-frame cleanup).
    bool RemoveEntity(const EntityPtr& entity);

    [[nodiscard]] EntityPtr FindEntity(EntityId id) const { return entities_.Find(id); }

    /// Re-index @p entity after its "position" component was edited in
    /// place.
    /// @return false if the entity has no position.
    bool UpdateEntityPosition(const EntityPtr& entity);

    // ── Templates ────────────────────────────────────────────────────

    foundation::GameResult<void> RegisterTemplate(std::string_view name, ComponentSet components);

    foundation::GameResult<void> ExtendTemplate(std::string_view baseName,
                                                std::string_view newName,
                                                const ComponentSet& additional = {},
                                                const ComponentSet& overrides = {});

    /// Create an entity from template @p name.
    ///
    /// Emits "entityTemplateCreating", "entityCreated" and
    /// "entityTemplateCreated" in that order.
    /// @return TemplateNotFound if @p name is not registered.
    [[nodiscard]] foundation::GameResult<EntityPtr>
    CreateEntityFromTemplate(std::string_view name, const ComponentSet& overrides = {});

    /// Apply template @p name to an existing entity.
    foundation::GameResult<void> ApplyTemplate(const EntityPtr& entity, std::string_view name,
                                               const ComponentSet& overrides = {});

    /// Registered entities built from template @p name.
    [[nodiscard]] std::vector<EntityPtr> GetEntitiesFromTemplate(std::string_view name) const;

    // ── Pools ────────────────────────────────────────────────────────

    [[nodiscard]] EntityPtr GetPooledEntity(std::string_view poolName);

    /// @return true if a pool accepted @p entity.
    bool ReturnToPool(const EntityPtr& entity);

    // ── Systems ──────────────────────────────────────────────────────

    /// Register a system of type `T`.  Emits "systemAdded" on first
    /// registration.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    /// Add an already constructed system.  Emits "systemAdded".
    System& AddSystem(std::unique_ptr<System> system);

    /// Create and add a plain System named @p name.  Emits "systemCreated".
    System& CreateSystem(std::string name, int priority = 0,
                         std::vector<std::string> requiredComponents = {});

    [[nodiscard]] System* GetSystem(std::string_view name) const { return systems_.GetSystem(name); }

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] std::vector<EntityPtr> GetEntitiesWith(const std::vector<std::string>& kinds) const {
        return entities_.GetEntitiesWith(kinds);
    }

    [[nodiscard]] std::vector<EntityPtr> GetEntitiesWithTag(std::string_view tag) const {
        return entities_.GetEntitiesWithTag(tag);
    }

    [[nodiscard]] std::vector<EntityPtr> GetEntitiesInRadius(double x, double y, double radius) const {
        return grid_.GetEntitiesInRadius(x, y, radius);
    }

    [[nodiscard]] std::vector<EntityPtr>
    GetEntitiesInRect(double x, double y, double width, double height) const {
        return grid_.GetEntitiesInRect(x, y, width, height);
    }

    [[nodiscard]] std::vector<EntityIdPair> GetPotentialCollisionPairs() const {
        return grid_.GetPotentialCollisionPairs();
    }

    // ── Events ───────────────────────────────────────────────────────

    ListenerHandle On(std::string_view eventType, EventCallback callback) {
        return bus_.On(eventType, std::move(callback));
    }

    bool Off(const ListenerHandle& handle) { return bus_.Off(handle); }

    void Emit(std::string_view eventType, EventData data = {}) {
        bus_.Emit(eventType, std::move(data));
    }

    // ── Persistence ──────────────────────────────────────────────────

    /// Snapshot of every active entity, the id counter and the templates.
    [[nodiscard]] WorldSnapshot Serialize() const;

    /// Write Serialize() to @p path.  Emits "worldSaved" or
    /// "worldSaveFailed".
    foundation::GameResult<void> SaveToFile(const std::filesystem::path& path);

    // ── Access ───────────────────────────────────────────────────────

    [[nodiscard]] EntityManager& Entities() noexcept { return entities_; }
    [[nodiscard]] const EntityManager& Entities() const noexcept { return entities_; }
    [[nodiscard]] SystemManager& Systems() noexcept { return systems_; }
    [[nodiscard]] EventBus& Events() noexcept { return bus_; }
    [[nodiscard]] SpatialGrid& Grid() noexcept { return grid_; }
    [[nodiscard]] const SpatialGrid& Grid() const noexcept { return grid_; }
    [[nodiscard]] TemplateRegistry& Templates() noexcept { return templates_; }
    [[nodiscard]] const TemplateRegistry& Templates() const noexcept { return templates_; }
    [[nodiscard]] const WorldConfig& Config() const noexcept { return config_; }

private:
    void registerDefaultSystems();
    void emitSystemAdded(const System& system);

    // Grid synchronization for the "position" component.
    void onComponentAdded(Entity& entity, std::string_view kind) override;
    void onComponentRemoved(Entity& entity, std::string_view kind) override;
    void onReset(Entity& entity, const TagSet& oldTags,
                 const ComponentSet& oldComponents) override;
    void onRemoved(Entity& entity) override;

    WorldConfig config_;
    EventBus bus_;
    SpatialGrid grid_;
    TemplateRegistry templates_;
    EntityManager entities_;
    SystemManager systems_;
};

template <typename T, typename... Args>
T& World::Register(Args&&... args) {
    const bool existed = systems_.GetSystem<T>() != nullptr;
    T& system = systems_.Register<T>(std::forward<Args>(args)...);
    if (!existed) {
        emitSystemAdded(system);
    }
    return system;
}

}  // namespace pecs::ecs
