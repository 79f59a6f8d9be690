#pragma once

/// @file system.hpp
/// @brief Base class for per-frame logic passes.

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pecs::ecs {

class Entity;
class EntityManager;

// ── System type identification ──────────────────────────────────────────

/// Integer type used to identify system types at runtime.
using SystemTypeId = uint32_t;

/// Sentinel value meaning "no system type" (systems added untyped).
constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── System ──────────────────────────────────────────────────────────────

/// A unit of per-frame logic over the entities carrying a required set of
/// components.
///
/// The default Update() and Draw() query the active entities holding
/// every required component and call ProcessEntity() / DrawEntity() for
/// each one still active when its turn comes.  Lower priority runs first.
class System {
public:
    explicit System(std::string name, int priority = 0,
                    std::vector<std::string> requiredComponents = {})
        : name_(std::move(name)),
          priority_(priority),
          required_(std::move(requiredComponents)) {}

    virtual ~System() = default;

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Run one update pass.
    virtual void Update(double deltaTime, EntityManager& entities);

    /// Run one draw pass.
    virtual void Draw(EntityManager& entities);

    /// Per-entity update hook.
    virtual void ProcessEntity(Entity& /*entity*/, double /*deltaTime*/) {}

    /// Per-entity draw hook.
    virtual void DrawEntity(Entity& /*entity*/) {}

    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }

    [[nodiscard]] int GetPriority() const noexcept { return priority_; }

    /// Takes effect in a SystemManager on its next Sort().
    void SetPriority(int priority) noexcept { priority_ = priority; }

    /// Replace the required component kinds.
    System& Require(std::vector<std::string> kinds) {
        required_ = std::move(kinds);
        return *this;
    }

    [[nodiscard]] const std::vector<std::string>& RequiredComponents() const noexcept {
        return required_;
    }

    [[nodiscard]] bool IsActive() const noexcept { return active_; }
    void Activate() noexcept { active_ = true; }
    void Deactivate() noexcept { active_ = false; }

private:
    std::string name_;
    int priority_;
    std::vector<std::string> required_;
    bool active_ = true;
};

}  // namespace pecs::ecs
