/// @file event_bus.cpp
/// @brief Queued event bus implementation.

#include "pecs/ecs/event_bus.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "pecs/foundation/game_logger.hpp"

namespace pecs::ecs {

using foundation::ListenerId;
using foundation::LogCategory;

// -- Subscribe ----------------------------------------------------------------

ListenerHandle EventBus::On(std::string_view eventType, EventCallback callback) {
    ListenerId id{nextListenerId_++};
    listeners_[std::string(eventType)].push_back(Listener{id, std::move(callback)});
    return ListenerHandle{std::string(eventType), id};
}

bool EventBus::Off(const ListenerHandle& handle) {
    if (!handle.isValid()) {
        return false;
    }
    auto it = listeners_.find(handle.eventType);
    if (it == listeners_.end()) {
        return false;
    }
    auto& list = it->second;
    auto pos = std::find_if(list.begin(), list.end(),
                            [&](const Listener& l) { return l.id == handle.id; });
    if (pos == list.end()) {
        return false;
    }
    list.erase(pos);
    if (list.empty()) {
        listeners_.erase(it);
    }
    return true;
}

void EventBus::ClearListeners(std::optional<std::string_view> eventType) {
    if (eventType) {
        listeners_.erase(std::string(*eventType));
    } else {
        listeners_.clear();
    }
}

// -- Publish ------------------------------------------------------------------

void EventBus::Emit(std::string_view eventType, EventData data) {
    queue_.push_back(QueuedEvent{std::string(eventType), std::move(data), now()});
}

void EventBus::reportListenerFailure(const std::string& eventType, const std::string& message) {
    foundation::LogContext ctx;
    ctx.eventType = eventType;
    foundation::GameLogger::instance().logWithContext(foundation::LogLevel::Error,
                                                      LogCategory::Events, message, ctx);
}

void EventBus::ProcessEvents() {
    // Swap out the current batch; anything emitted below lands in queue_.
    auto batch = std::move(queue_);
    queue_.clear();

    for (const auto& event : batch) {
        auto it = listeners_.find(event.type);
        if (it == listeners_.end()) {
            continue;
        }
        // Listeners may subscribe or unsubscribe while being invoked.
        auto snapshot = it->second;
        for (const auto& listener : snapshot) {
            try {
                listener.callback(event.data, event.timestamp);
            } catch (const std::exception& e) {
                reportListenerFailure(event.type, std::string("listener threw: ") + e.what());
            } catch (...) {
                reportListenerFailure(event.type, "listener threw a non-standard exception");
            }
        }
    }
}

// -- Introspection ------------------------------------------------------------

std::size_t EventBus::ListenerCount(std::optional<std::string_view> eventType) const {
    if (eventType) {
        auto it = listeners_.find(std::string(*eventType));
        return it == listeners_.end() ? 0 : it->second.size();
    }
    std::size_t total = 0;
    for (const auto& [type, list] : listeners_) {
        total += list.size();
    }
    return total;
}

double EventBus::now() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace pecs::ecs
