/// @file entity.cpp
/// @brief Entity component, tag and lifecycle operations.

#include "pecs/ecs/entity.hpp"

#include <algorithm>
#include <utility>

#include "pecs/ecs/event_bus.hpp"

namespace pecs::ecs {

namespace {

Value tagsToValue(const TagSet& tags) {
    Value::List list;
    list.reserve(tags.size());
    for (const auto& tag : tags) {
        list.emplace_back(tag);
    }
    return Value(std::move(list));
}

}  // namespace

Entity::Entity(EntityId id) : id_(id) {}

// ── Components ──────────────────────────────────────────────────────────

Entity& Entity::AddComponent(std::string_view kind, ComponentData data) {
    Value oldValue;
    auto it = components_.find(kind);
    if (it != components_.end()) {
        oldValue = Value(std::move(it->second));
        it->second = std::move(data);
    } else {
        it = components_.emplace(std::string(kind), std::move(data)).first;
    }

    if (observer_ != nullptr) {
        observer_->onComponentAdded(*this, kind);
    }
    if (bus_ != nullptr) {
        emit("componentAdded", Value::Map{
            {"componentType", Value(kind)},
            {"component", Value(it->second)},
            {"oldComponent", std::move(oldValue)},
        });
    }
    return *this;
}

const ComponentData* Entity::GetComponent(std::string_view kind) const {
    auto it = components_.find(kind);
    return it == components_.end() ? nullptr : &it->second;
}

ComponentData* Entity::GetComponent(std::string_view kind) {
    auto it = components_.find(kind);
    return it == components_.end() ? nullptr : &it->second;
}

bool Entity::HasComponent(std::string_view kind) const {
    return components_.find(kind) != components_.end();
}

bool Entity::HasComponents(const std::vector<std::string>& kinds) const {
    return std::all_of(kinds.begin(), kinds.end(),
                       [this](const std::string& kind) { return HasComponent(kind); });
}

Entity& Entity::RemoveComponent(std::string_view kind) {
    auto it = components_.find(kind);
    if (it == components_.end()) {
        return *this;
    }
    ComponentData removed = std::move(it->second);
    std::string removedKind = it->first;
    components_.erase(it);

    if (observer_ != nullptr) {
        observer_->onComponentRemoved(*this, removedKind);
    }
    if (bus_ != nullptr) {
        emit("componentRemoved", Value::Map{
            {"componentType", Value(removedKind)},
            {"component", Value(std::move(removed))},
        });
    }
    return *this;
}

// ── Tags ────────────────────────────────────────────────────────────────

Entity& Entity::AddTag(std::string_view tag) {
    auto [it, inserted] = tags_.emplace(tag);
    if (!inserted) {
        return *this;
    }
    if (observer_ != nullptr) {
        observer_->onTagAdded(*this, tag);
    }
    if (bus_ != nullptr) {
        emit("tagAdded", Value::Map{{"tag", Value(tag)}});
    }
    return *this;
}

bool Entity::HasTag(std::string_view tag) const {
    return tags_.find(tag) != tags_.end();
}

Entity& Entity::RemoveTag(std::string_view tag) {
    auto it = tags_.find(tag);
    if (it == tags_.end()) {
        return *this;
    }
    std::string removed = *it;
    tags_.erase(it);

    if (observer_ != nullptr) {
        observer_->onTagRemoved(*this, removed);
    }
    if (bus_ != nullptr) {
        emit("tagRemoved", Value::Map{{"tag", Value(removed)}});
    }
    return *this;
}

// ── Lifecycle ───────────────────────────────────────────────────────────

Entity& Entity::Activate() {
    if (active_) {
        return *this;
    }
    active_ = true;
    if (bus_ != nullptr) {
        emit("entityActivated");
    }
    return *this;
}

Entity& Entity::Deactivate() {
    if (!active_) {
        return *this;
    }
    active_ = false;
    if (bus_ != nullptr) {
        emit("entityDeactivated");
    }
    return *this;
}

Entity& Entity::Reset() {
    ComponentSet oldComponents = std::exchange(components_, {});
    TagSet oldTags = std::exchange(tags_, {});
    active_ = true;

    if (observer_ != nullptr) {
        observer_->onReset(*this, oldTags, oldComponents);
    }
    if (bus_ != nullptr) {
        emit("entityReset", Value::Map{
            {"oldComponents", componentsToValue(oldComponents)},
            {"oldTags", tagsToValue(oldTags)},
        });
    }
    return *this;
}

Entity& Entity::Destroy() {
    Deactivate();
    if (bus_ != nullptr) {
        emit("entityDestroyed");
    }
    return *this;
}

// ── World attachment ────────────────────────────────────────────────────

void Entity::Attach(EventBus* bus, EntityObserver* observer) noexcept {
    bus_ = bus;
    observer_ = observer;
}

void Entity::Detach() noexcept {
    bus_ = nullptr;
    observer_ = nullptr;
}

void Entity::emit(std::string_view type, Value::Map fields) {
    EventData data;
    data.entity = weak_from_this().lock();
    data.fields = std::move(fields);
    bus_->Emit(type, std::move(data));
}

}  // namespace pecs::ecs
