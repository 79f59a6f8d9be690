/// @file render_system.cpp
/// @brief RenderSystem layer sorting and dispatch.

#include "pecs/game/render_system.hpp"

#include <algorithm>
#include <string>

#include "pecs/ecs/entity_manager.hpp"
#include "pecs/game/components.hpp"

namespace pecs::game {

RenderSystem::RenderSystem()
    : System(kName, kPriority,
             {std::string(kinds::kTransform), std::string(kinds::kRenderer)}) {}

std::vector<ecs::EntityPtr> RenderSystem::DrawOrder(ecs::EntityManager& entities) const {
    auto order = entities.GetEntitiesWith(RequiredComponents());
    std::erase_if(order, [](const ecs::EntityPtr& e) {
        return !Renderer::FromData(*e->GetComponent(kinds::kRenderer)).visible;
    });
    std::stable_sort(order.begin(), order.end(),
                     [](const ecs::EntityPtr& a, const ecs::EntityPtr& b) {
                         return Renderer::FromData(*a->GetComponent(kinds::kRenderer)).layer <
                                Renderer::FromData(*b->GetComponent(kinds::kRenderer)).layer;
                     });
    return order;
}

void RenderSystem::Draw(ecs::EntityManager& entities) {
    for (const auto& entity : DrawOrder(entities)) {
        if (entity->IsActive()) {
            DrawEntity(*entity);
        }
    }
}

void RenderSystem::DrawEntity(ecs::Entity& entity) {
    if (auto drawable = entity.GetDrawable()) {
        drawable->Draw(entity);
    }
}

}  // namespace pecs::game
