/// @file entity_manager.cpp
/// @brief Entity ownership, tag index and pooling implementation.

#include "pecs/ecs/entity_manager.hpp"

#include <algorithm>

#include "pecs/ecs/event_bus.hpp"
#include "pecs/foundation/game_logger.hpp"

namespace pecs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

EntityManager::EntityManager(EventBus* bus) : bus_(bus) {}

EntityManager::~EntityManager() {
    // Outstanding EntityPtrs must not call back into a dead manager.
    for (auto& entity : entities_) {
        entity->Detach();
    }
    for (auto& [name, pool] : pools_) {
        for (auto& entity : pool) {
            entity->Detach();
        }
    }
}

// ── Entity lifecycle ─────────────────────────────────────────────────

EntityPtr EntityManager::CreateEntity() {
    auto entity = std::make_shared<Entity>(EntityId{nextId_++});
    registerEntity(entity);
    return entity;
}

GameResult<EntityPtr> EntityManager::CreateEntityWithId(EntityId id) {
    if (!id.isValid()) {
        return GameResult<EntityPtr>::err(
            GameError(ErrorCode::InvalidArgument, "entity id 0 is reserved"));
    }
    if (byId_.contains(id)) {
        return GameResult<EntityPtr>::err(
            GameError(ErrorCode::AlreadyExists,
                      "entity id already registered: " + std::to_string(id.value())));
    }
    if (id.value() >= nextId_) {
        nextId_ = id.value() + 1;
    }
    auto entity = std::make_shared<Entity>(id);
    registerEntity(entity);
    return GameResult<EntityPtr>::ok(std::move(entity));
}

bool EntityManager::AddEntity(const EntityPtr& entity) {
    if (!entity || byId_.contains(entity->Id())) {
        return false;
    }
    if (entity->Id().value() >= nextId_) {
        nextId_ = entity->Id().value() + 1;
    }
    registerEntity(entity);
    for (const auto& tag : entity->Tags()) {
        indexTag(entity, tag);
    }
    return true;
}

void EntityManager::RegisterEntityWithTag(const EntityPtr& entity, std::string_view tag) {
    if (!entity) {
        return;
    }
    if (!isTracked(*entity)) {
        AddEntity(entity);
    }
    // The tagAdded hook indexes the new tag.
    entity->AddTag(tag);
}

bool EntityManager::RemoveEntity(const EntityPtr& entity) {
    if (!entity || !isTracked(*entity)) {
        return false;
    }

    if (bus_ != nullptr) {
        EventData data;
        data.entity = entity;
        bus_->Emit("entityRemoved", std::move(data));
    }

    std::erase(entities_, entity);
    byId_.erase(entity->Id());
    for (const auto& tag : entity->Tags()) {
        unindexTag(entity->Id(), tag);
    }

    if (downstream_ != nullptr) {
        downstream_->onRemoved(*entity);
    }
    if (!isPooled(*entity)) {
        entity->Detach();
    }
    return true;
}

std::size_t EntityManager::Cleanup() {
    std::vector<EntityPtr> inactive;
    for (const auto& entity : entities_) {
        if (!entity->IsActive()) {
            inactive.push_back(entity);
        }
    }
    for (const auto& entity : inactive) {
        RemoveEntity(entity);
    }
    if (!inactive.empty()) {
        PECS_LOG_DEBUG(LogCategory::ECS,
                       "cleanup removed " + std::to_string(inactive.size()) + " entities");
    }
    return inactive.size();
}

// ── Pools ────────────────────────────────────────────────────────────

EntityPtr EntityManager::GetPooledEntity(std::string_view poolName, bool* fromPool) {
    auto poolIt = pools_.find(poolName);
    if (poolIt == pools_.end()) {
        poolIt = pools_.emplace(std::string(poolName), std::vector<EntityPtr>{}).first;
    }

    auto& pool = poolIt->second;
    if (pool.empty()) {
        PECS_LOG_DEBUG(LogCategory::ECS, "pool miss: " + std::string(poolName));
        if (fromPool != nullptr) {
            *fromPool = false;
        }
        auto entity = CreateEntity();
        entity->AddTag(poolName);
        return entity;
    }

    auto entity = std::move(pool.back());
    pool.pop_back();

    if (!isTracked(*entity)) {
        registerEntity(entity);
        for (const auto& tag : entity->Tags()) {
            indexTag(entity, tag);
        }
    }
    entity->Reset();
    entity->AddTag(poolName);

    if (fromPool != nullptr) {
        *fromPool = true;
    }
    return entity;
}

bool EntityManager::ReturnToPool(const EntityPtr& entity) {
    if (!entity) {
        return false;
    }
    for (const auto& tag : entity->Tags()) {
        auto poolIt = pools_.find(tag);
        if (poolIt == pools_.end()) {
            continue;
        }
        entity->Deactivate();
        auto& pool = poolIt->second;
        if (std::find(pool.begin(), pool.end(), entity) == pool.end()) {
            pool.push_back(entity);
        }
        return true;
    }
    entity->Deactivate();
    return false;
}

std::size_t EntityManager::PoolSize(std::string_view poolName) const {
    auto it = pools_.find(poolName);
    return it == pools_.end() ? 0 : it->second.size();
}

bool EntityManager::HasPool(std::string_view poolName) const {
    return pools_.find(poolName) != pools_.end();
}

// ── Queries ──────────────────────────────────────────────────────────

std::vector<EntityPtr> EntityManager::GetEntitiesWithTag(std::string_view tag) const {
    auto it = byTag_.find(tag);
    if (it == byTag_.end()) {
        return {};
    }
    return it->second;
}

std::vector<EntityPtr> EntityManager::GetEntitiesWithComponent(std::string_view kind) const {
    std::vector<EntityPtr> result;
    for (const auto& entity : entities_) {
        if (entity->IsActive() && entity->HasComponent(kind)) {
            result.push_back(entity);
        }
    }
    return result;
}

std::vector<EntityPtr> EntityManager::GetEntitiesWith(const std::vector<std::string>& kinds) const {
    std::vector<EntityPtr> result;
    for (const auto& entity : entities_) {
        if (entity->IsActive() && entity->HasComponents(kinds)) {
            result.push_back(entity);
        }
    }
    return result;
}

EntityPtr EntityManager::Find(EntityId id) const {
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : it->second;
}

// ── EntityObserver ───────────────────────────────────────────────────

void EntityManager::onComponentAdded(Entity& entity, std::string_view kind) {
    if (downstream_ != nullptr) {
        downstream_->onComponentAdded(entity, kind);
    }
}

void EntityManager::onComponentRemoved(Entity& entity, std::string_view kind) {
    if (downstream_ != nullptr) {
        downstream_->onComponentRemoved(entity, kind);
    }
}

void EntityManager::onTagAdded(Entity& entity, std::string_view tag) {
    if (isTracked(entity)) {
        indexTag(byId_.at(entity.Id()), tag);
    }
    if (downstream_ != nullptr) {
        downstream_->onTagAdded(entity, tag);
    }
}

void EntityManager::onTagRemoved(Entity& entity, std::string_view tag) {
    if (isTracked(entity)) {
        unindexTag(entity.Id(), tag);
    }
    if (downstream_ != nullptr) {
        downstream_->onTagRemoved(entity, tag);
    }
}

void EntityManager::onReset(Entity& entity, const TagSet& oldTags,
                            const ComponentSet& oldComponents) {
    if (isTracked(entity)) {
        for (const auto& tag : oldTags) {
            unindexTag(entity.Id(), tag);
        }
    }
    if (downstream_ != nullptr) {
        downstream_->onReset(entity, oldTags, oldComponents);
    }
}

// ── Internals ────────────────────────────────────────────────────────

void EntityManager::registerEntity(const EntityPtr& entity) {
    entity->Attach(bus_, this);
    entities_.push_back(entity);
    byId_[entity->Id()] = entity;
}

bool EntityManager::isTracked(const Entity& entity) const {
    auto it = byId_.find(entity.Id());
    return it != byId_.end() && it->second.get() == &entity;
}

bool EntityManager::isPooled(const Entity& entity) const {
    for (const auto& [name, pool] : pools_) {
        for (const auto& pooled : pool) {
            if (pooled.get() == &entity) {
                return true;
            }
        }
    }
    return false;
}

void EntityManager::indexTag(const EntityPtr& entity, std::string_view tag) {
    auto it = byTag_.find(tag);
    if (it == byTag_.end()) {
        it = byTag_.emplace(std::string(tag), std::vector<EntityPtr>{}).first;
    }
    auto& group = it->second;
    if (std::find(group.begin(), group.end(), entity) == group.end()) {
        group.push_back(entity);
    }
}

void EntityManager::unindexTag(EntityId id, std::string_view tag) {
    auto it = byTag_.find(tag);
    if (it == byTag_.end()) {
        return;
    }
    std::erase_if(it->second, [id](const EntityPtr& e) { return e->Id() == id; });
    if (it->second.empty()) {
        byTag_.erase(it);
    }
}

}  // namespace pecs::ecs
