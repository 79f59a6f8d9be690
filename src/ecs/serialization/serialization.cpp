/// @file serialization.cpp
/// @brief Snapshot capture, replay and YAML encoding.

#include "pecs/ecs/serialization.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

#include "pecs/ecs/world.hpp"
#include "pecs/foundation/game_logger.hpp"

namespace pecs::ecs {

using foundation::EntityId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr int kDoublePrecision = 17;

GameError malformed(std::string message) {
    return GameError(ErrorCode::SnapshotMalformed, "malformed snapshot: " + std::move(message));
}

// ── Encoding ────────────────────────────────────────────────────────────

void emitValue(YAML::Emitter& out, const Value& value);

void emitMap(YAML::Emitter& out, const Value::Map& map) {
    out << YAML::BeginMap;
    for (const auto& [key, field] : map) {
        out << YAML::Key << key << YAML::Value;
        emitValue(out, field);
    }
    out << YAML::EndMap;
}

void emitValue(YAML::Emitter& out, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            out << YAML::Null;
            break;
        case Value::Type::Bool:
            out << value.asBool();
            break;
        case Value::Type::Number:
            out << value.asNumber();
            break;
        case Value::Type::String:
            out << YAML::DoubleQuoted << value.asString();
            break;
        case Value::Type::List:
            out << YAML::BeginSeq;
            for (const auto& item : *value.asList()) {
                emitValue(out, item);
            }
            out << YAML::EndSeq;
            break;
        case Value::Type::Map:
            emitMap(out, *value.asMap());
            break;
    }
}

void emitComponents(YAML::Emitter& out, const ComponentSet& components) {
    out << YAML::BeginMap;
    for (const auto& [kind, data] : components) {
        out << YAML::Key << kind << YAML::Value;
        emitMap(out, data);
    }
    out << YAML::EndMap;
}

// ── Decoding ────────────────────────────────────────────────────────────

bool isQuotedString(const YAML::Node& node) {
    const auto& tag = node.Tag();
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

Value decodeValue(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar: {
            if (isQuotedString(node)) {
                return Value(node.Scalar());
            }
            const auto& text = node.Scalar();
            if (text == "true") {
                return Value(true);
            }
            if (text == "false") {
                return Value(false);
            }
            double number = 0.0;
            if (YAML::convert<double>::decode(node, number)) {
                return Value(number);
            }
            return Value(text);
        }
        case YAML::NodeType::Sequence: {
            Value::List list;
            list.reserve(node.size());
            for (const auto& item : node) {
                list.push_back(decodeValue(item));
            }
            return Value(std::move(list));
        }
        case YAML::NodeType::Map: {
            Value::Map map;
            for (const auto& entry : node) {
                map.insert_or_assign(entry.first.as<std::string>(), decodeValue(entry.second));
            }
            return Value(std::move(map));
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return Value();
}

GameResult<ComponentSet> decodeComponents(const YAML::Node& node, const std::string& where) {
    ComponentSet components;
    if (!node || node.IsNull()) {
        return GameResult<ComponentSet>::ok(std::move(components));
    }
    if (!node.IsMap()) {
        return GameResult<ComponentSet>::err(malformed(where + " must be a mapping"));
    }
    for (const auto& entry : node) {
        auto kind = entry.first.as<std::string>();
        if (entry.second.IsNull()) {
            components.insert_or_assign(kind, ComponentData{});
            continue;
        }
        if (!entry.second.IsMap()) {
            return GameResult<ComponentSet>::err(
                malformed(where + "." + kind + " must be a mapping"));
        }
        components.insert_or_assign(kind, *decodeValue(entry.second).asMap());
    }
    return GameResult<ComponentSet>::ok(std::move(components));
}

GameResult<EntitySnapshot> decodeEntity(const YAML::Node& node, std::size_t index) {
    const std::string where = "entities[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return GameResult<EntitySnapshot>::err(malformed(where + " must be a mapping"));
    }

    EntitySnapshot entity;

    uint64_t id = 0;
    const auto idNode = node["id"];
    if (!idNode || !idNode.IsScalar() || !YAML::convert<uint64_t>::decode(idNode, id)) {
        return GameResult<EntitySnapshot>::err(malformed(where + ".id must be an unsigned integer"));
    }
    entity.id = EntityId{id};

    if (const auto active = node["active"]) {
        if (!active.IsScalar() || !YAML::convert<bool>::decode(active, entity.active)) {
            return GameResult<EntitySnapshot>::err(malformed(where + ".active must be a bool"));
        }
    }

    if (const auto tags = node["tags"]) {
        if (!tags.IsSequence() && !tags.IsNull()) {
            return GameResult<EntitySnapshot>::err(malformed(where + ".tags must be a sequence"));
        }
        for (const auto& tag : tags) {
            if (!tag.IsScalar()) {
                return GameResult<EntitySnapshot>::err(malformed(where + ".tags must hold strings"));
            }
            entity.tags.push_back(tag.Scalar());
        }
    }

    auto components = decodeComponents(node["components"], where + ".components");
    if (!components) {
        return GameResult<EntitySnapshot>::err(components.error());
    }
    entity.components = std::move(components).value();
    return GameResult<EntitySnapshot>::ok(std::move(entity));
}

GameResult<WorldSnapshot> decodeRoot(const YAML::Node& root) {
    if (!root.IsMap()) {
        return GameResult<WorldSnapshot>::err(malformed("root must be a mapping"));
    }

    WorldSnapshot snapshot;

    if (const auto next = root["nextEntityId"]) {
        uint64_t value = 0;
        if (!next.IsScalar() || !YAML::convert<uint64_t>::decode(next, value)) {
            return GameResult<WorldSnapshot>::err(
                malformed("nextEntityId must be an unsigned integer"));
        }
        snapshot.nextEntityId = EntityId{value};
    }

    if (const auto entities = root["entities"]) {
        if (!entities.IsSequence() && !entities.IsNull()) {
            return GameResult<WorldSnapshot>::err(malformed("entities must be a sequence"));
        }
        std::size_t index = 0;
        for (const auto& node : entities) {
            auto entity = decodeEntity(node, index++);
            if (!entity) {
                return GameResult<WorldSnapshot>::err(entity.error());
            }
            snapshot.entities.push_back(std::move(entity).value());
        }
    }

    if (const auto templates = root["templates"]) {
        if (!templates.IsMap() && !templates.IsNull()) {
            return GameResult<WorldSnapshot>::err(malformed("templates must be a mapping"));
        }
        for (const auto& entry : templates) {
            auto name = entry.first.as<std::string>();
            auto components = decodeComponents(entry.second, "templates." + name);
            if (!components) {
                return GameResult<WorldSnapshot>::err(components.error());
            }
            snapshot.templates.insert_or_assign(std::move(name), std::move(components).value());
        }
    }

    return GameResult<WorldSnapshot>::ok(std::move(snapshot));
}

}  // namespace

// ── Capture / replay ────────────────────────────────────────────────────

WorldSnapshot SerializeWorld(const World& world) {
    WorldSnapshot snapshot;
    snapshot.nextEntityId = world.Entities().NextEntityId();

    for (const auto& entity : world.Entities().Entities()) {
        if (!entity->IsActive()) {
            continue;
        }
        EntitySnapshot es;
        es.id = entity->Id();
        es.active = true;
        es.tags.assign(entity->Tags().begin(), entity->Tags().end());
        es.components = entity->Components();
        snapshot.entities.push_back(std::move(es));
    }
    std::sort(snapshot.entities.begin(), snapshot.entities.end(),
              [](const EntitySnapshot& a, const EntitySnapshot& b) { return a.id < b.id; });

    for (const auto& [name, tmpl] : world.Templates().All()) {
        snapshot.templates.emplace(name, tmpl.components);
    }
    return snapshot;
}

GameResult<std::unique_ptr<World>> DeserializeWorld(const WorldSnapshot& snapshot,
                                                    const WorldConfig& config) {
    using Result = GameResult<std::unique_ptr<World>>;

    auto created = World::Create(config);
    if (!created) {
        return created;
    }
    auto world = std::move(created).value();

    for (const auto& [name, components] : snapshot.templates) {
        auto registered = world->Templates().Register(name, components);
        if (!registered) {
            return Result::err(registered.error());
        }
    }

    std::unordered_set<EntityId> seen;
    uint64_t maxId = 0;
    for (const auto& es : snapshot.entities) {
        if (!es.id.isValid()) {
            return Result::err(malformed("entity id 0 is reserved"));
        }
        if (!seen.insert(es.id).second) {
            return Result::err(GameError(ErrorCode::DuplicateEntityId,
                                         "duplicate entity id in snapshot: " +
                                             std::to_string(es.id.value())));
        }
        maxId = std::max(maxId, es.id.value());

        // Built detached so that replay publishes no per-field events.
        auto entity = std::make_shared<Entity>(es.id);
        for (const auto& tag : es.tags) {
            entity->AddTag(tag);
        }
        for (const auto& [kind, data] : es.components) {
            entity->AddComponent(kind, data);
        }
        if (!es.active) {
            entity->Deactivate();
        }
        world->AddEntity(entity);
    }

    world->Entities().SetNextEntityId(
        EntityId{std::max(snapshot.nextEntityId.value(), maxId + 1)});

    EventData loaded;
    loaded.fields.emplace("entityCount", Value(snapshot.entities.size()));
    world->Emit("worldLoaded", std::move(loaded));

    PECS_LOG_DEBUG(LogCategory::Serialization,
                   "world loaded with " + std::to_string(snapshot.entities.size()) + " entities");
    return Result::ok(std::move(world));
}

// ── Text form ───────────────────────────────────────────────────────────

std::string EncodeSnapshot(const WorldSnapshot& snapshot) {
    YAML::Emitter out;
    out.SetDoublePrecision(kDoublePrecision);

    out << YAML::BeginMap;
    out << YAML::Key << "nextEntityId" << YAML::Value << snapshot.nextEntityId.value();

    out << YAML::Key << "entities" << YAML::Value << YAML::BeginSeq;
    for (const auto& entity : snapshot.entities) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << entity.id.value();
        out << YAML::Key << "active" << YAML::Value << entity.active;
        out << YAML::Key << "tags" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& tag : entity.tags) {
            out << YAML::DoubleQuoted << tag;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "components" << YAML::Value;
        emitComponents(out, entity.components);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "templates" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, components] : snapshot.templates) {
        out << YAML::Key << name << YAML::Value;
        emitComponents(out, components);
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str(), out.size());
}

GameResult<WorldSnapshot> DecodeSnapshot(std::string_view text) {
    try {
        return decodeRoot(YAML::Load(std::string(text)));
    } catch (const YAML::ParserException& e) {
        return GameResult<WorldSnapshot>::err(malformed(std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return GameResult<WorldSnapshot>::err(malformed(e.what()));
    }
}

// ── Files ───────────────────────────────────────────────────────────────

GameResult<void> SaveWorldToFile(const World& world, const std::filesystem::path& path) {
    const auto text = EncodeSnapshot(SerializeWorld(world));

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        PECS_LOG_ERROR(LogCategory::Serialization, "cannot open for writing: " + path.string());
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotWriteFailed, "cannot open snapshot file for writing: " +
                                                          path.string()));
    }
    file << text;
    file.flush();
    if (!file) {
        PECS_LOG_ERROR(LogCategory::Serialization, "write failed: " + path.string());
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotWriteFailed, "failed to write snapshot file: " +
                                                          path.string()));
    }
    return GameResult<void>::ok();
}

GameResult<std::unique_ptr<World>> LoadWorldFromFile(const std::filesystem::path& path,
                                                     const WorldConfig& config) {
    using Result = GameResult<std::unique_ptr<World>>;

    std::ifstream file(path);
    if (!file) {
        PECS_LOG_ERROR(LogCategory::Serialization, "cannot open for reading: " + path.string());
        return Result::err(GameError(ErrorCode::SnapshotReadFailed,
                                     "cannot open snapshot file: " + path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result::err(GameError(ErrorCode::SnapshotReadFailed,
                                     "failed to read snapshot file: " + path.string()));
    }

    auto snapshot = DecodeSnapshot(buffer.str());
    if (!snapshot) {
        PECS_LOG_ERROR(LogCategory::Serialization,
                       path.string() + ": " + snapshot.error().describe());
        return Result::err(snapshot.error());
    }
    return DeserializeWorld(snapshot.value(), config);
}

}  // namespace pecs::ecs
