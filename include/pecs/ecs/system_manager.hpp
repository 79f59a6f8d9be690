#pragma once

/// @file system_manager.hpp
/// @brief Priority-ordered system registry and frame driver.
///
/// SystemManager owns every system of a world and runs them in ascending
/// priority.  Systems with equal priority keep their registration order.

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "pecs/ecs/system.hpp"

namespace pecs::ecs {

class EntityManager;

class SystemManager {
public:
    SystemManager() = default;

    // Non-copyable, movable.
    SystemManager(const SystemManager&) = delete;
    SystemManager& operator=(const SystemManager&) = delete;
    SystemManager(SystemManager&&) noexcept = default;
    SystemManager& operator=(SystemManager&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Register a system of type `T`, constructing it in-place.
    ///
    /// Re-registering the same type is a no-op and returns the existing
    /// instance.
    ///
    /// @tparam T     Concrete system type (must derive from System).
    /// @param  args  Forwarded to T's constructor.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    /// Add an already constructed system.  No type deduplication.
    System& Add(std::unique_ptr<System> system);

    /// Re-sort after a system's priority changed.
    void Sort();

    [[nodiscard]] std::size_t SystemCount() const noexcept { return systems_.size(); }

    // ── Lookup ──────────────────────────────────────────────────────

    /// Most recently added system named @p name, or nullptr.
    [[nodiscard]] System* GetSystem(std::string_view name) const;

    /// Registered system of type `T`, or nullptr.
    template <typename T>
    [[nodiscard]] T* GetSystem() const;

    /// System names in execution order.
    [[nodiscard]] std::vector<std::string> ExecutionOrder() const;

    // ── Enable / disable ────────────────────────────────────────────

    /// @return false if no system is named @p name.
    bool ActivateSystem(std::string_view name);
    bool DeactivateSystem(std::string_view name);

    // ── Execution ───────────────────────────────────────────────────

    /// Update every active system in priority order.
    void Update(double deltaTime, EntityManager& entities);

    /// Draw every active system in priority order.
    void Draw(EntityManager& entities);

private:
    struct SystemEntry {
        std::unique_ptr<System> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
    };

    System& insert(std::unique_ptr<System> system, SystemTypeId typeId);

    /// Raw pointers in execution order, taken before each pass.
    [[nodiscard]] std::vector<System*> snapshot() const;

    /// Sorted by priority; stable for equal priorities.
    std::vector<SystemEntry> systems_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemManager::Register(Args&&... args) {
    static_assert(std::is_base_of_v<System, T>, "T must derive from System");

    const auto typeId = SystemType<T>::Id();
    if (auto* existing = GetSystem<T>()) {
        return *existing;
    }
    return static_cast<T&>(insert(std::make_unique<T>(std::forward<Args>(args)...), typeId));
}

template <typename T>
T* SystemManager::GetSystem() const {
    const auto typeId = SystemType<T>::Id();
    for (const auto& entry : systems_) {
        if (entry.typeId == typeId) {
            return static_cast<T*>(entry.instance.get());
        }
    }
    return nullptr;
}

}  // namespace pecs::ecs
