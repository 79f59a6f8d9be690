#pragma once

/// @file entity_manager.hpp
/// @brief Entity ownership, tag index and named entity pools.
///
/// EntityManager owns the live entity list of one world.  It hands out
/// ids, keeps a tag -> entities index current as tags change, recycles
/// entities through named pools and drops inactive entities in a single
/// end-of-frame Cleanup() pass.

#include "pecs/ecs/entity.hpp"
#include "pecs/foundation/game_result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pecs::ecs {

class EventBus;

/// Manages the full lifecycle of entities in one world.
///
/// Every registered entity is attached to the manager's EventBus and
/// reports its structural changes back to the manager, which updates the
/// tag index and forwards the change to an optional downstream observer.
///
/// Queries return snapshot vectors, so callers may create, tag or
/// deactivate entities while iterating the result.
class EntityManager : public EntityObserver {
public:
    explicit EntityManager(EventBus* bus = nullptr);
    ~EntityManager() override;

    // Entities keep a pointer to their manager.
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) = delete;
    EntityManager& operator=(EntityManager&&) = delete;

    /// Forward entity changes to @p observer after the manager handled them.
    void SetObserver(EntityObserver* observer) noexcept { downstream_ = observer; }

    /// Bus the managed entities publish on (may be null).
    [[nodiscard]] EventBus* Bus() const noexcept { return bus_; }

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create and register a new active entity with the next free id.
    [[nodiscard]] EntityPtr CreateEntity();

    /// Create and register an entity with an explicit id (snapshot replay).
    ///
    /// The id counter is advanced past @p id.
    /// @return AlreadyExists if @p id is already registered.
    [[nodiscard]] foundation::GameResult<EntityPtr> CreateEntityWithId(EntityId id);

    /// Register an existing entity and index its current tags.
    /// @return false if @p entity is null or its id is already registered.
    bool AddEntity(const EntityPtr& entity);

    /// Add @p tag to @p entity, registering the entity if needed.
    void RegisterEntityWithTag(const EntityPtr& entity, std::string_view tag);

    /// Drop @p entity from the live list and every tag group.
    ///
    /// Emits "entityRemoved".  Entities not held by a pool are detached.
    /// @return false if @p entity was not registered.
    bool RemoveEntity(const EntityPtr& entity);

    /// Remove every inactive entity.  Called once per frame after systems.
    /// @return Number of entities removed.
    std::size_t Cleanup();

    // ── Pools ────────────────────────────────────────────────────────

    /// Take an entity from pool @p poolName, or create one tagged with it.
    ///
    /// A recycled entity is reset (no components, active) and keeps only
    /// the pool tag.  It is registered again if Cleanup() had dropped it.
    [[nodiscard]] EntityPtr GetPooledEntity(std::string_view poolName, bool* fromPool = nullptr);

    /// Deactivate @p entity and file it under the first of its tags naming
    /// an existing pool.
    /// @return true if a pool accepted it; false if it was only deactivated.
    bool ReturnToPool(const EntityPtr& entity);

    /// Entities waiting in pool @p poolName.
    [[nodiscard]] std::size_t PoolSize(std::string_view poolName) const;

    [[nodiscard]] bool HasPool(std::string_view poolName) const;

    // ── Queries ──────────────────────────────────────────────────────

    /// Registered entities carrying @p tag (active or not).
    [[nodiscard]] std::vector<EntityPtr> GetEntitiesWithTag(std::string_view tag) const;

    /// Active entities carrying @p kind.
    [[nodiscard]] std::vector<EntityPtr> GetEntitiesWithComponent(std::string_view kind) const;

    /// Active entities carrying every kind in @p kinds.
    [[nodiscard]] std::vector<EntityPtr> GetEntitiesWith(const std::vector<std::string>& kinds) const;

    /// Registered entity with @p id, or nullptr.
    [[nodiscard]] EntityPtr Find(EntityId id) const;

    [[nodiscard]] const std::vector<EntityPtr>& Entities() const noexcept { return entities_; }
    [[nodiscard]] std::size_t Count() const noexcept { return entities_.size(); }

    // ── Id counter ───────────────────────────────────────────────────

    [[nodiscard]] EntityId NextEntityId() const noexcept { return EntityId{nextId_}; }
    void SetNextEntityId(EntityId next) noexcept { nextId_ = next.value(); }

    // ── EntityObserver ───────────────────────────────────────────────

    void onComponentAdded(Entity& entity, std::string_view kind) override;
    void onComponentRemoved(Entity& entity, std::string_view kind) override;
    void onTagAdded(Entity& entity, std::string_view tag) override;
    void onTagRemoved(Entity& entity, std::string_view tag) override;
    void onReset(Entity& entity, const TagSet& oldTags,
                 const ComponentSet& oldComponents) override;

private:
    void registerEntity(const EntityPtr& entity);
    [[nodiscard]] bool isTracked(const Entity& entity) const;
    [[nodiscard]] bool isPooled(const Entity& entity) const;
    void indexTag(const EntityPtr& entity, std::string_view tag);
    void unindexTag(EntityId id, std::string_view tag);

    EventBus* bus_;
    EntityObserver* downstream_ = nullptr;

    std::vector<EntityPtr> entities_;
    std::unordered_map<EntityId, EntityPtr> byId_;
    std::map<std::string, std::vector<EntityPtr>, std::less<>> byTag_;
    std::map<std::string, std::vector<EntityPtr>, std::less<>> pools_;

    uint64_t nextId_ = 1;
};

}  // namespace pecs::ecs
