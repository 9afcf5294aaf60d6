#pragma once

#include "osync/events/event_bus.hpp"
#include "osync/events/event_queue.hpp"
#include "osync/events/events.hpp"

#include <memory>
#include <optional>

namespace osync::events {

/**
 * @brief Per-entity channel of status changes for the UI
 *
 * Subscribes on construction and unsubscribes on destruction. The handler
 * only holds a shared reference to the queue, so an emit racing with the
 * destructor never touches a dead stream.
 */
class StatusStream {
public:
    StatusStream(EventBus& bus, sync::EntityRef entity)
        : bus_(bus),
          entity_(std::move(entity)),
          queue_(std::make_shared<ThreadSafeQueue<SyncStatusChangedEvent>>()) {
        auto queue = queue_;
        auto wanted = entity_;
        subscription_ = bus_.subscribe<SyncStatusChangedEvent>(
            [queue, wanted](const SyncStatusChangedEvent& e) {
                if (e.entity == wanted) {
                    queue->push(e);
                }
            });
    }

    ~StatusStream() {
        bus_.unsubscribe<SyncStatusChangedEvent>(subscription_);
        queue_->shutdown();
    }

    StatusStream(const StatusStream&) = delete;
    StatusStream& operator=(const StatusStream&) = delete;

    const sync::EntityRef& entity() const noexcept { return entity_; }

    std::optional<SyncStatusChangedEvent> try_next() { return queue_->try_pop(); }

    template<typename Rep, typename Period>
    std::optional<SyncStatusChangedEvent> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_->pop_for(timeout);
    }

    size_t buffered() const { return queue_->size(); }

private:
    EventBus& bus_;
    sync::EntityRef entity_;
    std::shared_ptr<ThreadSafeQueue<SyncStatusChangedEvent>> queue_;
    size_t subscription_ = 0;
};

} // namespace osync::events
