/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe between the intake services and observers
 *
 * WHY THIS FILE EXISTS:
 * The upload path and the worker report progress without knowing who
 * listens. Logging and metrics subscribe; services only emit.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) { ... });
 * bus.emit(UploadCompletedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace vault::events {

/**
 * @brief Event bus keyed by event type
 *
 * THREAD SAFETY:
 * - Any thread may emit (one per HTTP connection, plus the worker)
 * - Handlers run synchronously in the emitting thread
 * - Dispatch works on a snapshot, so a handler may subscribe or unsubscribe
 */
class EventBus {
public:
    using SubscriptionId = size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        slots_[key<EventType>()].push_back(Slot{id, std::move(erased)});
        return id;
    }

    /// Unknown ids are ignored.
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        if (found == slots_.end()) {
            return;
        }
        auto& slots = found->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
    }

    /**
     * @brief Deliver @p event to every current subscriber
     *
     * A handler that throws is logged and skipped; the emitter never sees
     * the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        for (const auto& handler : snapshot(key<EventType>())) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Subscriber to {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        return found == slots_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Slot {
        SubscriptionId id;
        std::shared_ptr<const ErasedHandler> handler;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<const ErasedHandler>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const ErasedHandler>> handlers;
        std::shared_lock lock(mutex_);
        auto found = slots_.find(type);
        if (found != slots_.end()) {
            handlers.reserve(found->second.size());
            for (const auto& slot : found->second) {
                handlers.push_back(slot.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace vault::events
