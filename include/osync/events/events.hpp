/**
 * @file events.hpp
 * @brief Event types published by the sync engine
 *
 * WHY THIS FILE EXISTS:
 * The engine never talks to the UI, the logger or the metrics directly.
 * It publishes these structs on the EventBus and whoever cares subscribes.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ItemEnqueuedEvent, ConflictResolvedEvent
 * - Every event carries the engine clock's timestamp of the change
 */

#pragma once

#include "osync/sync/conflict.hpp"
#include "osync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace osync::events {

// ════════════════════════════════════════════════════════
// Queue Events
// ════════════════════════════════════════════════════════

/**
 * @brief A new item entered the queue
 *
 * WHO EMITS: SyncEngine::enqueue (new item, not a coalesce)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ItemEnqueuedEvent {
    std::string item_id;
    sync::EntityRef entity;
    sync::OperationKind kind = sync::OperationKind::Update;
    sync::Priority priority = sync::Priority::Normal;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A new operation was folded into an existing Pending item
 *
 * WHO EMITS: SyncEngine::enqueue
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct OperationCoalescedEvent {
    std::string item_id;
    sync::EntityRef entity;
    sync::OperationKind resulting_kind = sync::OperationKind::Update;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An item moved through the status state machine
 *
 * WHO EMITS: SyncEngine, once per transition, after its lock is released
 * WHO SUBSCRIBES:
 * - StatusStream (UI badges per entity)
 * - Logger
 * - Metrics (counts terminal outcomes)
 */
struct SyncStatusChangedEvent {
    std::string item_id;
    sync::EntityRef entity;
    sync::SyncStatus from = sync::SyncStatus::Pending;
    sync::SyncStatus to = sync::SyncStatus::Pending;
    std::string detail;  ///< Error text for Failed, rule name for conflict outcomes
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A Failed item got a backoff deadline
 */
struct RetryScheduledEvent {
    std::string item_id;
    sync::EntityRef entity;
    std::uint32_t retry_count = 0;
    sync::Timestamp next_attempt_at{};
    std::string error;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

struct ConflictDetectedEvent {
    std::string item_id;
    sync::EntityRef entity;
    sync::VersionVector local_vector;
    sync::VersionVector remote_vector;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

struct ConflictResolvedEvent {
    std::string item_id;
    sync::EntityRef entity;
    sync::ResolutionKind resolution = sync::ResolutionKind::ManualPending;
    std::string rule;
    std::optional<std::string> follow_up_id;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The remote version won and should replace local state
 *
 * WHO EMITS: SyncEngine when a conflict resolves RemoteWins, or when a
 *            stale local operation is superseded
 * WHO SUBSCRIBES: The local store collaborator, which overwrites its copy
 */
struct RemoteAdoptedEvent {
    sync::EntityRef entity;
    sync::RemoteSnapshot snapshot;
    sync::Timestamp timestamp{std::chrono::system_clock::now()};
};

} // namespace osync::events
