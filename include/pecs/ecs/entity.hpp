#pragma once

/// @file entity.hpp
/// @brief Game object identity with its component records and tags.
///
/// An Entity owns its components and tags exclusively.  When attached to a
/// world it publishes lifecycle events on the world's EventBus and keeps
/// the world's indices current through an EntityObserver.

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "pecs/ecs/value.hpp"
#include "pecs/foundation/types.hpp"

namespace pecs::game {
struct CollisionData;
}  // namespace pecs::game

namespace pecs::ecs {

class Entity;
class EventBus;

using EntityId = foundation::EntityId;
using EntityPtr = std::shared_ptr<Entity>;
using TagSet = std::set<std::string, std::less<>>;

// ── Capabilities ────────────────────────────────────────────────────────

/// Reaction to a narrow-phase contact.  Invoked synchronously by the
/// CollisionSystem with the contact seen from this entity's side.
class CollisionHandler {
public:
    virtual ~CollisionHandler() = default;
    virtual void OnCollision(Entity& self, Entity& other,
                             const game::CollisionData& data) = 0;
};

/// Drawing hook called by the RenderSystem in layer order.
class Drawable {
public:
    virtual ~Drawable() = default;
    virtual void Draw(const Entity& self) = 0;
};

/// Receives structural changes of an attached entity.
///
/// All hooks default to no-ops.  The EntityManager uses them to maintain
/// its tag index; the World to keep the spatial grid in sync.
class EntityObserver {
public:
    virtual ~EntityObserver() = default;

    virtual void onComponentAdded(Entity& /*entity*/, std::string_view /*kind*/) {}
    virtual void onComponentRemoved(Entity& /*entity*/, std::string_view /*kind*/) {}
    virtual void onTagAdded(Entity& /*entity*/, std::string_view /*tag*/) {}
    virtual void onTagRemoved(Entity& /*entity*/, std::string_view /*tag*/) {}

    /// Called after Reset() cleared the entity; @p oldTags/@p oldComponents
    /// hold what it carried before.
    virtual void onReset(Entity& /*entity*/, const TagSet& /*oldTags*/,
                         const ComponentSet& /*oldComponents*/) {}

    /// Called by the owning EntityManager when it drops the entity.
    virtual void onRemoved(Entity& /*entity*/) {}
};

// ── Entity ──────────────────────────────────────────────────────────────

/// One game object: an id, a set of component records, a set of tags and
/// an active flag.
///
/// Entities are shared through EntityPtr so that queued events can keep
/// them alive past end-of-frame cleanup.  Component and tag operations
/// never fail; removing something absent is a no-op.
class Entity : public std::enable_shared_from_this<Entity> {
public:
    explicit Entity(EntityId id);

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    [[nodiscard]] EntityId Id() const noexcept { return id_; }
    [[nodiscard]] bool IsActive() const noexcept { return active_; }

    // ── Components ──────────────────────────────────────────────────────

    /// Store a copy of @p data under @p kind, replacing any previous
    /// record.  Emits "componentAdded" with the old and new record.
    Entity& AddComponent(std::string_view kind, ComponentData data = {});

    /// Return the record for @p kind, or nullptr if absent.
    [[nodiscard]] const ComponentData* GetComponent(std::string_view kind) const;
    [[nodiscard]] ComponentData* GetComponent(std::string_view kind);

    [[nodiscard]] bool HasComponent(std::string_view kind) const;

    /// True when every kind in @p kinds is present.
    [[nodiscard]] bool HasComponents(const std::vector<std::string>& kinds) const;

    /// Drop the record for @p kind.  Emits "componentRemoved" if present.
    Entity& RemoveComponent(std::string_view kind);

    [[nodiscard]] const ComponentSet& Components() const noexcept { return components_; }

    // ── Tags ────────────────────────────────────────────────────────────

    /// Add @p tag.  Emits "tagAdded" only if the tag was new.
    Entity& AddTag(std::string_view tag);
    [[nodiscard]] bool HasTag(std::string_view tag) const;

    /// Remove @p tag.  Emits "tagRemoved" only if the tag was present.
    Entity& RemoveTag(std::string_view tag);

    [[nodiscard]] const TagSet& Tags() const noexcept { return tags_; }

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Emits "entityActivated" only on an actual state change.
    Entity& Activate();

    /// Emits "entityDeactivated" only on an actual state change.
    Entity& Deactivate();

    /// Clear every component and tag and reactivate.  Used by pooling.
    /// Emits "entityReset" carrying the previous components and tags.
    Entity& Reset();

    /// Deactivate, then emit "entityDestroyed".
    Entity& Destroy();

    // ── World attachment ────────────────────────────────────────────────

    /// Route events to @p bus and structural changes to @p observer.
    void Attach(EventBus* bus, EntityObserver* observer) noexcept;

    /// Stop publishing events and notifying the observer.
    void Detach() noexcept;

    [[nodiscard]] bool IsAttached() const noexcept { return bus_ != nullptr; }

    // ── Capabilities ────────────────────────────────────────────────────

    void SetCollisionHandler(std::shared_ptr<CollisionHandler> handler) {
        collisionHandler_ = std::move(handler);
    }
    [[nodiscard]] std::shared_ptr<CollisionHandler> GetCollisionHandler() const noexcept {
        return collisionHandler_;
    }

    void SetDrawable(std::shared_ptr<Drawable> drawable) { drawable_ = std::move(drawable); }
    [[nodiscard]] std::shared_ptr<Drawable> GetDrawable() const noexcept { return drawable_; }

private:
    void emit(std::string_view type, Value::Map fields = {});

    EntityId id_;
    ComponentSet components_;
    TagSet tags_;
    bool active_ = true;

    EventBus* bus_ = nullptr;
    EntityObserver* observer_ = nullptr;

    std::shared_ptr<CollisionHandler> collisionHandler_;
    std::shared_ptr<Drawable> drawable_;
};

}  // namespace pecs::ecs
