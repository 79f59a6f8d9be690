#pragma once

/// @file value.hpp
/// @brief Dynamic field values and component records.
///
/// Components are open records of named fields rather than compile-time
/// structs: gameplay code adds and removes them at runtime and the
/// snapshot format stores them structurally.  `Value` is the tagged union
/// for a single field; `ComponentData` is one component record and
/// `ComponentSet` a bundle of records keyed by component kind.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace pecs::ecs {

/// A single dynamically-typed field value.
///
/// Numbers are stored as double.  Lists and maps nest recursively and are
/// copied deeply, so a Value never aliases another Value's storage.
class Value {
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value, std::less<>>;

    enum class Type : uint8_t { Null, Bool, Number, String, List, Map };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(List list) : data_(std::move(list)) {}
    Value(Map map) : data_(std::move(map)) {}

    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T number) : data_(static_cast<double>(number)) {}

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }

    [[nodiscard]] bool isNull() const noexcept { return type() == Type::Null; }
    [[nodiscard]] bool isBool() const noexcept { return type() == Type::Bool; }
    [[nodiscard]] bool isNumber() const noexcept { return type() == Type::Number; }
    [[nodiscard]] bool isString() const noexcept { return type() == Type::String; }
    [[nodiscard]] bool isList() const noexcept { return type() == Type::List; }
    [[nodiscard]] bool isMap() const noexcept { return type() == Type::Map; }

    /// Typed reads returning @p fallback when the stored type differs.
    [[nodiscard]] bool asBool(bool fallback = false) const noexcept;
    [[nodiscard]] double asNumber(double fallback = 0.0) const noexcept;
    [[nodiscard]] std::string asString(std::string_view fallback = {}) const;

    /// Access nested containers; nullptr when the type differs.
    [[nodiscard]] const List* asList() const noexcept { return std::get_if<List>(&data_); }
    [[nodiscard]] List* asList() noexcept { return std::get_if<List>(&data_); }
    [[nodiscard]] const Map* asMap() const noexcept { return std::get_if<Map>(&data_); }
    [[nodiscard]] Map* asMap() noexcept { return std::get_if<Map>(&data_); }

    /// Recursive structural equality.
    bool operator==(const Value& other) const;

private:
    // Alternative order must match Type.
    std::variant<std::monostate, bool, double, std::string, List, Map> data_;
};

/// One component record: field name -> value.
using ComponentData = Value::Map;

/// Component records keyed by component kind.
using ComponentSet = std::map<std::string, ComponentData, std::less<>>;

/// Return the name of a value type ("null", "bool", ...).
std::string_view valueTypeName(Value::Type type) noexcept;

// -- Field helpers ------------------------------------------------------------

/// Read a numeric field, or @p fallback when absent or not a number.
[[nodiscard]] double getNumber(const ComponentData& data, std::string_view field,
                               double fallback = 0.0);

/// Read a boolean field, or @p fallback when absent or not a bool.
[[nodiscard]] bool getBool(const ComponentData& data, std::string_view field,
                           bool fallback = false);

/// Read a string field, or @p fallback when absent or not a string.
[[nodiscard]] std::string getString(const ComponentData& data, std::string_view field,
                                    std::string_view fallback = {});

/// True when @p field is present (any type, including null).
[[nodiscard]] bool hasField(const ComponentData& data, std::string_view field);

/// Insert or overwrite a field.
void setField(ComponentData& data, std::string_view field, Value value);

/// Shallow merge: every field of @p overrides replaces the field of the
/// same name in @p base.
void mergeFields(ComponentData& base, const ComponentData& overrides);

/// Nest a whole component set into one map value (kind -> record).
[[nodiscard]] Value componentsToValue(const ComponentSet& components);

} // namespace pecs::ecs
