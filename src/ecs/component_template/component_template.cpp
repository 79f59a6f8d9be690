/// @file component_template.cpp
/// @brief Template registration, extension and application.

#include "pecs/ecs/component_template.hpp"

#include "pecs/foundation/game_logger.hpp"

namespace pecs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameError notFound(std::string_view name) {
    return GameError(ErrorCode::TemplateNotFound,
                     "component template does not exist: " + std::string(name));
}

}  // namespace

std::string TemplateRegistry::TemplateTag(std::string_view name) {
    return "template:" + std::string(name);
}

GameResult<void> TemplateRegistry::Register(std::string_view name, ComponentSet components) {
    if (name.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "template name must not be empty"));
    }
    if (Exists(name)) {
        return GameResult<void>::err(
            GameError(ErrorCode::TemplateAlreadyExists,
                      "component template already exists: " + std::string(name)));
    }
    templates_.emplace(std::string(name),
                       ComponentTemplate{std::string(name), std::move(components)});
    PECS_LOG_DEBUG(LogCategory::Template, "template registered: " + std::string(name));
    return GameResult<void>::ok();
}

GameResult<void> TemplateRegistry::Extend(std::string_view baseName, std::string_view newName,
                                          const ComponentSet& additional,
                                          const ComponentSet& overrides) {
    const auto* base = Get(baseName);
    if (base == nullptr) {
        return GameResult<void>::err(notFound(baseName));
    }
    if (Exists(newName)) {
        return GameResult<void>::err(
            GameError(ErrorCode::TemplateAlreadyExists,
                      "component template already exists: " + std::string(newName)));
    }

    ComponentSet components = base->components;
    for (const auto& [kind, fields] : overrides) {
        auto it = components.find(kind);
        if (it != components.end()) {
            mergeFields(it->second, fields);
        }
    }
    // A kind the base already carries is only replaced, as a whole record,
    // when the overrides name it too.
    for (const auto& [kind, fields] : additional) {
        if (!components.contains(kind) || overrides.contains(kind)) {
            components.insert_or_assign(kind, fields);
        }
    }
    return Register(newName, std::move(components));
}

GameResult<void> TemplateRegistry::Apply(Entity& entity, std::string_view name,
                                         const ComponentSet& overrides) const {
    const auto* tmpl = Get(name);
    if (tmpl == nullptr) {
        return GameResult<void>::err(notFound(name));
    }
    for (const auto& [kind, fields] : tmpl->components) {
        ComponentData data = fields;
        auto it = overrides.find(kind);
        if (it != overrides.end()) {
            mergeFields(data, it->second);
        }
        entity.AddComponent(kind, std::move(data));
    }
    entity.AddTag(TemplateTag(name));
    return GameResult<void>::ok();
}

const ComponentTemplate* TemplateRegistry::Get(std::string_view name) const {
    auto it = templates_.find(name);
    return it == templates_.end() ? nullptr : &it->second;
}

GameResult<ComponentSet> TemplateRegistry::Components(std::string_view name) const {
    const auto* tmpl = Get(name);
    if (tmpl == nullptr) {
        return GameResult<ComponentSet>::err(notFound(name));
    }
    return GameResult<ComponentSet>::ok(tmpl->components);
}

std::vector<std::string> TemplateRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(templates_.size());
    for (const auto& [name, tmpl] : templates_) {
        names.push_back(name);
    }
    return names;
}

bool TemplateRegistry::Remove(std::string_view name) {
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        return false;
    }
    templates_.erase(it);
    return true;
}

}  // namespace pecs::ecs
