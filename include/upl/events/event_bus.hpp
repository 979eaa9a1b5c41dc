/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe for pipeline notifications
 *
 * WHY THIS FILE EXISTS:
 * Stages announce what they did (session created, chunk stored, scan
 * finished...) without knowing who listens. Logging and metrics hang off
 * the bus instead of being wired into every stage.
 *
 * WHAT IT DOES:
 * - Subscription keyed by the event's C++ type
 * - Concurrent emit/subscribe from any thread
 * - Handlers run synchronously on the emitting thread
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent& e) { ... });
 * bus.emit(SessionCreatedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace upl::events {

/**
 * @brief Type-keyed event bus
 *
 * THREAD SAFETY:
 * A shared_mutex guards the handler table. emit() copies the handler list
 * under a shared lock and calls the handlers after releasing it, so a
 * handler may itself subscribe or emit.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Handler id to pass to unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& entry) { return entry.first == handler_id; }),
            handler_list.end());
    }

    /**
     * @brief Deliver an event to every handler of its type
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitting stage is never interrupted.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (const auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace upl::events
