/**
 * @file components.hpp
 * @brief Ready-made subscribers for engine events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * SyncEngine engine(config, remote, store, bus);
 * // Every enqueue, transition and conflict is now logged and counted
 */

#pragma once

#include "osync/events/event_bus.hpp"
#include "osync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace osync::events {

/**
 * @brief Logs every engine event through spdlog
 *
 * Transitions into Failed and conflict detections log at warn level,
 * everything else at info, per-transition detail at debug.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<ItemEnqueuedEvent>([](const ItemEnqueuedEvent& e) {
            spdlog::info("[Enqueued] item={} entity={} kind={} priority={}",
                         e.item_id, e.entity.to_string(), sync::to_string(e.kind), sync::to_string(e.priority));
        });

        track<OperationCoalescedEvent>([](const OperationCoalescedEvent& e) {
            spdlog::info("[Coalesced] item={} entity={} kind={}",
                         e.item_id, e.entity.to_string(), sync::to_string(e.resulting_kind));
        });

        track<SyncStatusChangedEvent>([](const SyncStatusChangedEvent& e) {
            if (e.to == sync::SyncStatus::Failed) {
                spdlog::warn("[Status] item={} entity={} {} -> {} ({})",
                             e.item_id, e.entity.to_string(), sync::to_string(e.from), sync::to_string(e.to), e.detail);
            } else if (sync::is_terminal(e.to)) {
                spdlog::info("[Status] item={} entity={} {} -> {}",
                             e.item_id, e.entity.to_string(), sync::to_string(e.from), sync::to_string(e.to));
            } else {
                spdlog::debug("[Status] item={} entity={} {} -> {}",
                              e.item_id, e.entity.to_string(), sync::to_string(e.from), sync::to_string(e.to));
            }
        });

        track<RetryScheduledEvent>([](const RetryScheduledEvent& e) {
            spdlog::warn("[RetryScheduled] item={} entity={} retries={} error={}",
                         e.item_id, e.entity.to_string(), e.retry_count, e.error);
        });

        track<ConflictDetectedEvent>([](const ConflictDetectedEvent& e) {
            spdlog::warn("[ConflictDetected] item={} entity={} local={} remote={}",
                         e.item_id, e.entity.to_string(), e.local_vector.to_string(), e.remote_vector.to_string());
        });

        track<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] item={} entity={} resolution={} rule={} follow_up={}",
                         e.item_id, e.entity.to_string(), sync::to_string(e.resolution), e.rule,
                         e.follow_up_id.value_or("-"));
        });

        track<RemoteAdoptedEvent>([](const RemoteAdoptedEvent& e) {
            spdlog::info("[RemoteAdopted] entity={} vector={} tombstone={}",
                         e.entity.to_string(), e.snapshot.vector.to_string(), e.snapshot.deleted);
        });
    }

    ~LoggerComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.emplace_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts queue outcomes for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().items_synced.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> items_enqueued{0};
        std::atomic<uint64_t> operations_coalesced{0};
        std::atomic<uint64_t> items_synced{0};
        std::atomic<uint64_t> items_failed{0};
        std::atomic<uint64_t> items_superseded{0};
        std::atomic<uint64_t> items_dismissed{0};
        std::atomic<uint64_t> retries_scheduled{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_auto_resolved{0};
        std::atomic<uint64_t> conflicts_escalated{0};
        std::atomic<uint64_t> remote_adoptions{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<ItemEnqueuedEvent>([this](const ItemEnqueuedEvent&) {
            stats_.items_enqueued++;
        }));
        ids_.push_back(bus_.subscribe<OperationCoalescedEvent>([this](const OperationCoalescedEvent&) {
            stats_.operations_coalesced++;
        }));
        ids_.push_back(bus_.subscribe<SyncStatusChangedEvent>([this](const SyncStatusChangedEvent& e) {
            on_status_changed(e);
        }));
        ids_.push_back(bus_.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent&) {
            stats_.retries_scheduled++;
        }));
        ids_.push_back(bus_.subscribe<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) {
            stats_.conflicts_detected++;
        }));
        ids_.push_back(bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent& e) {
            if (e.resolution == sync::ResolutionKind::ManualPending) {
                stats_.conflicts_escalated++;
            } else {
                stats_.conflicts_auto_resolved++;
            }
        }));
        ids_.push_back(bus_.subscribe<RemoteAdoptedEvent>([this](const RemoteAdoptedEvent&) {
            stats_.remote_adoptions++;
        }));
    }

    ~MetricsComponent() {
        bus_.unsubscribe<ItemEnqueuedEvent>(ids_[0]);
        bus_.unsubscribe<OperationCoalescedEvent>(ids_[1]);
        bus_.unsubscribe<SyncStatusChangedEvent>(ids_[2]);
        bus_.unsubscribe<RetryScheduledEvent>(ids_[3]);
        bus_.unsubscribe<ConflictDetectedEvent>(ids_[4]);
        bus_.unsubscribe<ConflictResolvedEvent>(ids_[5]);
        bus_.unsubscribe<RemoteAdoptedEvent>(ids_[6]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Enqueued:        {}", stats_.items_enqueued.load());
        spdlog::info("  Coalesced:       {}", stats_.operations_coalesced.load());
        spdlog::info("  Synced:          {}", stats_.items_synced.load());
        spdlog::info("  Failed:          {}", stats_.items_failed.load());
        spdlog::info("  Superseded:      {}", stats_.items_superseded.load());
        spdlog::info("  Dismissed:       {}", stats_.items_dismissed.load());
        spdlog::info("  Retries:         {}", stats_.retries_scheduled.load());
        spdlog::info("  Conflicts det.:  {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts auto:  {}", stats_.conflicts_auto_resolved.load());
        spdlog::info("  Conflicts esc.:  {}", stats_.conflicts_escalated.load());
        spdlog::info("  Remote adopted:  {}", stats_.remote_adoptions.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_status_changed(const SyncStatusChangedEvent& e) {
        switch (e.to) {
            case sync::SyncStatus::Synced: stats_.items_synced++; break;
            case sync::SyncStatus::Failed: stats_.items_failed++; break;
            case sync::SyncStatus::Superseded: stats_.items_superseded++; break;
            case sync::SyncStatus::Dismissed: stats_.items_dismissed++; break;
            default: break;
        }
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<size_t> ids_;
};

} // namespace osync::events
