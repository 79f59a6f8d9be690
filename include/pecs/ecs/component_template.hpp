#pragma once

/// @file component_template.hpp
/// @brief Named component bundles used to stamp out entities.
///
/// A template is a ComponentSet registered under a unique name.  Applying
/// it copies every component onto an entity, merges per-kind field
/// overrides, and tags the entity "template:<name>".  Each World owns its
/// own registry.

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "pecs/ecs/entity.hpp"
#include "pecs/ecs/value.hpp"
#include "pecs/foundation/game_result.hpp"

namespace pecs::ecs {

/// A registered template.
struct ComponentTemplate {
    std::string name;
    ComponentSet components;
};

/// Registry of component templates.
///
/// Registration conflicts and unknown names are configuration errors and
/// are reported as TemplateAlreadyExists / TemplateNotFound.
class TemplateRegistry {
public:
    using TemplateMap = std::map<std::string, ComponentTemplate, std::less<>>;

    /// Tag carried by entities built from template @p name.
    [[nodiscard]] static std::string TemplateTag(std::string_view name);

    /// Register @p components under @p name (stored by copy).
    foundation::GameResult<void> Register(std::string_view name, ComponentSet components);

    /// Register @p newName as a copy of @p baseName with changes.
    ///
    /// @p overrides merge field-by-field into kinds the base already has
    /// (kinds the base lacks are ignored).  @p additional kinds the base
    /// lacks are added.  An @p additional kind the base already has is
    /// ignored unless @p overrides also names it, in which case the
    /// additional record replaces the component outright.
    foundation::GameResult<void> Extend(std::string_view baseName, std::string_view newName,
                                        const ComponentSet& additional = {},
                                        const ComponentSet& overrides = {});

    /// Copy every component of template @p name onto @p entity.
    ///
    /// Overrides for kinds the template does not define are ignored.
    foundation::GameResult<void> Apply(Entity& entity, std::string_view name,
                                       const ComponentSet& overrides = {}) const;

    /// Template @p name, or nullptr.
    [[nodiscard]] const ComponentTemplate* Get(std::string_view name) const;

    [[nodiscard]] bool Exists(std::string_view name) const { return Get(name) != nullptr; }

    /// Copy of the components of template @p name.
    [[nodiscard]] foundation::GameResult<ComponentSet> Components(std::string_view name) const;

    /// Registered names in ascending order.
    [[nodiscard]] std::vector<std::string> Names() const;

    /// @return true if a template was removed.
    bool Remove(std::string_view name);

    void Clear() noexcept { templates_.clear(); }

    [[nodiscard]] std::size_t Size() const noexcept { return templates_.size(); }

    [[nodiscard]] const TemplateMap& All() const noexcept { return templates_; }

private:
    TemplateMap templates_;
};

}  // namespace pecs::ecs
