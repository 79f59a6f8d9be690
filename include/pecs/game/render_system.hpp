#pragma once

/// @file render_system.hpp
/// @brief Layer-ordered draw pass over entities with a renderer.

#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/system.hpp"

#include <vector>

namespace pecs::game {

/// Draws every active, visible entity carrying transform and renderer
/// through its Drawable capability, in ascending `renderer.layer`.
/// Entities on the same layer keep query order.  No drawing backend is
/// involved; the Drawable does the actual work.
class RenderSystem : public ecs::System {
public:
    static constexpr int kPriority = 100;
    static constexpr const char* kName = "RenderSystem";

    RenderSystem();

    void Draw(ecs::EntityManager& entities) override;

    void DrawEntity(ecs::Entity& entity) override;

    /// Entities the next Draw() would visit, in order.
    [[nodiscard]] std::vector<ecs::EntityPtr> DrawOrder(ecs::EntityManager& entities) const;
};

}  // namespace pecs::game
