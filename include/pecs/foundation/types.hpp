#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the runtime.

#include <cstdint>
#include <functional>

namespace pecs::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID kinds at compile time while
/// keeping the same underlying representation.  Zero is reserved as the
/// invalid sentinel.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};
struct ListenerIdTag {};

/// Unique identifier for an entity within one world.
/// Ids are handed out monotonically starting at 1.
using EntityId = StrongId<EntityIdTag>;

/// Identifier of an event listener registration.
using ListenerId = StrongId<ListenerIdTag>;

} // namespace pecs::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<pecs::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const pecs::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
