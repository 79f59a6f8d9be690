#pragma once

/// @file event_bus.hpp
/// @brief Queued, string-keyed publish/subscribe bus.
///
/// Emitting never calls listeners synchronously: events are queued and
/// delivered by ProcessEvents(), which the World calls once per frame
/// after every system has run.
///
/// Usage:
/// @code
///   EventBus bus;
///
///   auto handle = bus.On("collision", [](const EventData& e, double time) {
///       // react to the contact
///   });
///
///   bus.Emit("collision", EventData{a, b});
///   bus.ProcessEvents();  // delivers the queued event
///
///   bus.Off(handle);
/// @endcode

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pecs/ecs/value.hpp"
#include "pecs/foundation/types.hpp"

namespace pecs::ecs {

class Entity;

/// Payload carried by a queued event.
///
/// The entity pointers keep their targets alive until delivery, so an
/// entity removed by end-of-frame cleanup is still valid in listeners.
struct EventData {
    std::shared_ptr<Entity> entity;
    std::shared_ptr<Entity> other;

    /// Structured fields defined by convention per event type.
    Value::Map fields;

    /// Optional typed payload (e.g. game::CollisionData).
    std::any context;

    /// Return the field @p name, or nullptr when absent.
    [[nodiscard]] const Value* field(std::string_view name) const {
        auto it = fields.find(name);
        return it == fields.end() ? nullptr : &it->second;
    }

    /// Access the typed context payload (nullptr on type mismatch).
    template <typename T>
    [[nodiscard]] const T* contextAs() const noexcept {
        return std::any_cast<T>(&context);
    }
};

/// Listener signature: event payload plus the emit timestamp in seconds.
using EventCallback = std::function<void(const EventData& event, double timestamp)>;

/// Handle returned by On() and accepted by Off().
struct ListenerHandle {
    std::string eventType;
    foundation::ListenerId id;

    [[nodiscard]] bool isValid() const noexcept { return id.isValid(); }
};

/// Queued event bus.  One instance per World; instances share nothing.
///
/// Thread safety: None.  All calls happen on the frame thread.
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) noexcept = default;
    EventBus& operator=(EventBus&&) noexcept = default;

    // -- Subscribe ------------------------------------------------------------

    /// Register @p callback for @p eventType.
    ///
    /// Listeners of one type are invoked in registration order.
    ListenerHandle On(std::string_view eventType, EventCallback callback);

    /// Remove the listener identified by @p handle.
    /// @return true if a listener was removed.
    bool Off(const ListenerHandle& handle);

    /// Remove every listener for @p eventType, or all listeners when empty.
    void ClearListeners(std::optional<std::string_view> eventType = std::nullopt);

    // -- Publish --------------------------------------------------------------

    /// Queue an event.  Listeners run on the next ProcessEvents().
    void Emit(std::string_view eventType, EventData data = {});

    /// Deliver every event queued before this call.
    ///
    /// Events emitted by listeners while processing are kept for the next
    /// call.  A listener that throws is logged and skipped; delivery
    /// continues with the remaining listeners and events.
    void ProcessEvents();

    /// Drop all queued events without delivering them.
    void ClearQueue() noexcept { queue_.clear(); }

    // -- Introspection --------------------------------------------------------

    [[nodiscard]] std::size_t PendingEventCount() const noexcept { return queue_.size(); }

    /// Listener count for @p eventType, or across all types when empty.
    [[nodiscard]] std::size_t ListenerCount(
        std::optional<std::string_view> eventType = std::nullopt) const;

private:
    struct Listener {
        foundation::ListenerId id;
        EventCallback callback;
    };

    struct QueuedEvent {
        std::string type;
        EventData data;
        double timestamp = 0.0;
    };

    static double now();
    static void reportListenerFailure(const std::string& eventType, const std::string& message);

    std::unordered_map<std::string, std::vector<Listener>> listeners_;
    std::vector<QueuedEvent> queue_;
    uint64_t nextListenerId_ = 1;
};

}  // namespace pecs::ecs
