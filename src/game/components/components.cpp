/// @file components.cpp
/// @brief Typed component view conversions.

#include "pecs/game/components.hpp"

#include <algorithm>

namespace pecs::game {

using ecs::getBool;
using ecs::getNumber;
using ecs::getString;
using ecs::setField;
using ecs::Value;

namespace {

std::optional<double> optionalNumber(const ComponentData& data, std::string_view field) {
    auto it = data.find(field);
    if (it == data.end() || !it->second.isNumber()) {
        return std::nullopt;
    }
    return it->second.asNumber();
}

void setOptional(ComponentData& data, std::string_view field, const std::optional<double>& v) {
    if (v) {
        setField(data, field, *v);
    }
}

}  // namespace

// ── Transform ───────────────────────────────────────────────────────────

Transform Transform::FromData(const ComponentData& data) {
    Transform t;
    t.x = getNumber(data, "x");
    t.y = getNumber(data, "y");
    t.width = getNumber(data, "width");
    t.height = getNumber(data, "height");
    t.rotation = getNumber(data, "rotation");
    return t;
}

void Transform::WriteTo(ComponentData& data) const {
    setField(data, "x", x);
    setField(data, "y", y);
    setField(data, "width", width);
    setField(data, "height", height);
    setField(data, "rotation", rotation);
}

ComponentData Transform::ToData() const {
    ComponentData data;
    WriteTo(data);
    return data;
}

// ── Position ────────────────────────────────────────────────────────────

Position Position::FromData(const ComponentData& data) {
    return Position{getNumber(data, "x"), getNumber(data, "y")};
}

void Position::WriteTo(ComponentData& data) const {
    setField(data, "x", x);
    setField(data, "y", y);
}

ComponentData Position::ToData() const {
    ComponentData data;
    WriteTo(data);
    return data;
}

// ── Physics ─────────────────────────────────────────────────────────────

Physics Physics::FromData(const ComponentData& data) {
    Physics p;
    p.velocityX = getNumber(data, "velocityX");
    p.velocityY = getNumber(data, "velocityY");
    p.gravity = optionalNumber(data, "gravity");
    p.affectedByGravity = getBool(data, "affectedByGravity");
    p.friction = optionalNumber(data, "friction");
    p.airResistance = optionalNumber(data, "airResistance");
    p.dampening = optionalNumber(data, "dampening");
    p.isGrounded = getBool(data, "isGrounded");
    p.disabled = getBool(data, "disabled");
    return p;
}

void Physics::WriteTo(ComponentData& data) const {
    setField(data, "velocityX", velocityX);
    setField(data, "velocityY", velocityY);
    setOptional(data, "gravity", gravity);
    setField(data, "affectedByGravity", affectedByGravity);
    setOptional(data, "friction", friction);
    setOptional(data, "airResistance", airResistance);
    setOptional(data, "dampening", dampening);
    setField(data, "isGrounded", isGrounded);
    setField(data, "disabled", disabled);
}

ComponentData Physics::ToData() const {
    ComponentData data;
    WriteTo(data);
    return data;
}

// ── Collider ────────────────────────────────────────────────────────────

bool Collider::CollidesWith(std::string_view other) const {
    return std::find(collidesWithLayers.begin(), collidesWithLayers.end(), other) !=
           collidesWithLayers.end();
}

Collider Collider::FromData(const ComponentData& data) {
    Collider c;
    c.layer = getString(data, "layer");
    auto it = data.find("collidesWithLayers");
    if (it != data.end()) {
        if (const auto* list = it->second.asList()) {
            for (const auto& item : *list) {
                if (item.isString()) {
                    c.collidesWithLayers.push_back(item.asString());
                }
            }
        }
    }
    c.width = getNumber(data, "width");
    c.height = getNumber(data, "height");
    c.offsetX = getNumber(data, "offsetX");
    c.offsetY = getNumber(data, "offsetY");
    c.isSolid = getBool(data, "isSolid", true);
    c.isTrigger = getBool(data, "isTrigger");
    return c;
}

void Collider::WriteTo(ComponentData& data) const {
    Value::List layers;
    layers.reserve(collidesWithLayers.size());
    for (const auto& l : collidesWithLayers) {
        layers.emplace_back(l);
    }
    setField(data, "layer", layer);
    setField(data, "collidesWithLayers", std::move(layers));
    setField(data, "width", width);
    setField(data, "height", height);
    setField(data, "offsetX", offsetX);
    setField(data, "offsetY", offsetY);
    setField(data, "isSolid", isSolid);
    setField(data, "isTrigger", isTrigger);
}

ComponentData Collider::ToData() const {
    ComponentData data;
    WriteTo(data);
    return data;
}

// ── TypeInfo / Renderer ─────────────────────────────────────────────────

TypeInfo TypeInfo::FromData(const ComponentData& data) {
    return TypeInfo{getString(data, "name", "entity")};
}

ComponentData TypeInfo::ToData() const {
    return ComponentData{{"name", Value(name)}};
}

Renderer Renderer::FromData(const ComponentData& data) {
    return Renderer{getNumber(data, "layer"), getBool(data, "visible", true)};
}

ComponentData Renderer::ToData() const {
    return ComponentData{{"layer", Value(layer)}, {"visible", Value(visible)}};
}

}  // namespace pecs::game
