/// @file system_manager.cpp
/// @brief System base passes and SystemManager implementation.

#include "pecs/ecs/system_manager.hpp"

#include <algorithm>

#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/entity_manager.hpp"
#include "pecs/foundation/game_logger.hpp"

namespace pecs::ecs {

using foundation::LogCategory;

// ── System ──────────────────────────────────────────────────────────────

void System::Update(double deltaTime, EntityManager& entities) {
    for (const auto& entity : entities.GetEntitiesWith(required_)) {
        // A previous entity's hook may have deactivated this one.
        if (entity->IsActive()) {
            ProcessEntity(*entity, deltaTime);
        }
    }
}

void System::Draw(EntityManager& entities) {
    for (const auto& entity : entities.GetEntitiesWith(required_)) {
        if (entity->IsActive()) {
            DrawEntity(*entity);
        }
    }
}

// ── Registration ────────────────────────────────────────────────────────

System& SystemManager::Add(std::unique_ptr<System> system) {
    return insert(std::move(system), kInvalidSystemTypeId);
}

System& SystemManager::insert(std::unique_ptr<System> system, SystemTypeId typeId) {
    const int priority = system->GetPriority();
    // After every entry of equal or lower priority: keeps insertion order.
    auto pos = std::upper_bound(systems_.begin(), systems_.end(), priority,
                                [](int p, const SystemEntry& e) {
                                    return p < e.instance->GetPriority();
                                });
    System& ref = *system;
    systems_.insert(pos, SystemEntry{std::move(system), typeId});

    PECS_LOG_INFO(LogCategory::ECS,
                  "system registered: " + ref.GetName() +
                      " (priority " + std::to_string(priority) + ")");
    return ref;
}

void SystemManager::Sort() {
    std::stable_sort(systems_.begin(), systems_.end(),
                     [](const SystemEntry& a, const SystemEntry& b) {
                         return a.instance->GetPriority() < b.instance->GetPriority();
                     });
}

// ── Lookup ──────────────────────────────────────────────────────────────

System* SystemManager::GetSystem(std::string_view name) const {
    System* found = nullptr;
    for (const auto& entry : systems_) {
        if (entry.instance->GetName() == name) {
            found = entry.instance.get();
        }
    }
    return found;
}

std::vector<std::string> SystemManager::ExecutionOrder() const {
    std::vector<std::string> names;
    names.reserve(systems_.size());
    for (const auto& entry : systems_) {
        names.push_back(entry.instance->GetName());
    }
    return names;
}

// ── Enable / disable ────────────────────────────────────────────────────

bool SystemManager::ActivateSystem(std::string_view name) {
    auto* system = GetSystem(name);
    if (system == nullptr) {
        return false;
    }
    system->Activate();
    return true;
}

bool SystemManager::DeactivateSystem(std::string_view name) {
    auto* system = GetSystem(name);
    if (system == nullptr) {
        return false;
    }
    system->Deactivate();
    return true;
}

// ── Execution ───────────────────────────────────────────────────────────

std::vector<System*> SystemManager::snapshot() const {
    std::vector<System*> order;
    order.reserve(systems_.size());
    for (const auto& entry : systems_) {
        order.push_back(entry.instance.get());
    }
    return order;
}

void SystemManager::Update(double deltaTime, EntityManager& entities) {
    for (auto* system : snapshot()) {
        if (system->IsActive()) {
            system->Update(deltaTime, entities);
        }
    }
}

void SystemManager::Draw(EntityManager& entities) {
    for (auto* system : snapshot()) {
        if (system->IsActive()) {
            system->Draw(entities);
        }
    }
}

}  // namespace pecs::ecs
