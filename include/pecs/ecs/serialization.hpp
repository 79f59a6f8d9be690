#pragma once

/// @file serialization.hpp
/// @brief World snapshots and their YAML text form.
///
/// A snapshot captures what is needed to rebuild a world: the active
/// entities (id, tags, components), the id counter and the registered
/// templates.  Systems, listeners, queued events and entity capabilities
/// are runtime wiring and are not part of it.
///
/// Text form:
/// @code
///   nextEntityId: 4
///   entities:
///     - id: 1
///       active: true
///       tags: ["player"]
///       components:
///         transform: {x: 0, y: 0, width: 32, height: 48}
///         type: {name: "player"}
///   templates:
///     crate:
///       transform: {width: 16, height: 16}
/// @endcode
///
/// Strings are always emitted double-quoted; unquoted scalars decode as
/// null, bool or number when they parse as one.

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pecs/ecs/value.hpp"
#include "pecs/ecs/world_config.hpp"
#include "pecs/foundation/game_result.hpp"
#include "pecs/foundation/types.hpp"

namespace pecs::ecs {

class World;

struct EntitySnapshot {
    foundation::EntityId id;
    bool active = true;
    std::vector<std::string> tags;
    ComponentSet components;
};

struct WorldSnapshot {
    std::vector<EntitySnapshot> entities;
    foundation::EntityId nextEntityId{1};
    std::map<std::string, ComponentSet, std::less<>> templates;
};

/// Capture every active entity of @p world, ordered by id.
[[nodiscard]] WorldSnapshot SerializeWorld(const World& world);

/// Build a fresh world from @p snapshot.
///
/// Entities keep their ids; the id counter resumes past the highest one.
/// Emits "worldLoaded" on the new world's bus.
/// @return DuplicateEntityId if an id repeats, SnapshotMalformed for id 0,
///         or the World::Create() / template registration error.
[[nodiscard]] foundation::GameResult<std::unique_ptr<World>>
DeserializeWorld(const WorldSnapshot& snapshot, const WorldConfig& config = {});

/// Render @p snapshot as YAML text.
[[nodiscard]] std::string EncodeSnapshot(const WorldSnapshot& snapshot);

/// Parse YAML text produced by EncodeSnapshot().
/// @return SnapshotMalformed on a parse error or unexpected structure.
[[nodiscard]] foundation::GameResult<WorldSnapshot> DecodeSnapshot(std::string_view text);

/// Write the snapshot of @p world to @p path.
/// @return SnapshotWriteFailed if the file cannot be written.
foundation::GameResult<void> SaveWorldToFile(const World& world,
                                             const std::filesystem::path& path);

/// Read, decode and deserialize the snapshot at @p path.
/// @return SnapshotReadFailed if the file cannot be read, otherwise the
///         DecodeSnapshot() / DeserializeWorld() error.
[[nodiscard]] foundation::GameResult<std::unique_ptr<World>>
LoadWorldFromFile(const std::filesystem::path& path, const WorldConfig& config = {});

}  // namespace pecs::ecs
