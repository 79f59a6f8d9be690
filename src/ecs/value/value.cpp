/// @file value.cpp
/// @brief Value accessors and ComponentData field helpers.

#include "pecs/ecs/value.hpp"

#include <utility>

namespace pecs::ecs {

bool Value::asBool(bool fallback) const noexcept {
    if (const auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    return fallback;
}

double Value::asNumber(double fallback) const noexcept {
    if (const auto* n = std::get_if<double>(&data_)) {
        return *n;
    }
    return fallback;
}

std::string Value::asString(std::string_view fallback) const {
    if (const auto* s = std::get_if<std::string>(&data_)) {
        return *s;
    }
    return std::string(fallback);
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

std::string_view valueTypeName(Value::Type type) noexcept {
    switch (type) {
        case Value::Type::Null:   return "null";
        case Value::Type::Bool:   return "bool";
        case Value::Type::Number: return "number";
        case Value::Type::String: return "string";
        case Value::Type::List:   return "list";
        case Value::Type::Map:    return "map";
    }
    return "unknown";
}

// -- Field helpers ------------------------------------------------------------

double getNumber(const ComponentData& data, std::string_view field, double fallback) {
    auto it = data.find(field);
    return it == data.end() ? fallback : it->second.asNumber(fallback);
}

bool getBool(const ComponentData& data, std::string_view field, bool fallback) {
    auto it = data.find(field);
    return it == data.end() ? fallback : it->second.asBool(fallback);
}

std::string getString(const ComponentData& data, std::string_view field,
                      std::string_view fallback) {
    auto it = data.find(field);
    return it == data.end() ? std::string(fallback) : it->second.asString(fallback);
}

bool hasField(const ComponentData& data, std::string_view field) {
    return data.find(field) != data.end();
}

void setField(ComponentData& data, std::string_view field, Value value) {
    auto it = data.find(field);
    if (it != data.end()) {
        it->second = std::move(value);
    } else {
        data.emplace(std::string(field), std::move(value));
    }
}

void mergeFields(ComponentData& base, const ComponentData& overrides) {
    for (const auto& [field, value] : overrides) {
        setField(base, field, value);
    }
}

Value componentsToValue(const ComponentSet& components) {
    Value::Map map;
    for (const auto& [kind, data] : components) {
        map.emplace(kind, Value(data));
    }
    return Value(std::move(map));
}

} // namespace pecs::ecs
