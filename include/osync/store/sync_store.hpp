#pragma once

/**
 * @file sync_store.hpp
 * @brief Durable home of the queue and the per-entity vectors
 *
 * The engine writes through on every change so that a queue survives an
 * application restart. Two tables:
 * - items:   id, entity, kind, payload, priority, status, vector,
 *            retry_count, created_at and the rest of SyncItemState
 * - vectors: entity → current local VersionVector
 * plus the id and sequence counters, so ids of finished items are never
 * handed out again.
 */

#include "osync/core/result.hpp"
#include "osync/sync/item.hpp"
#include "osync/sync/types.hpp"
#include "osync/sync/version_vector.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace osync::store {

using VectorTable = std::map<sync::EntityRef, sync::VersionVector>;

struct QueueCounters {
    std::uint64_t item = 0;      ///< Last "item-N" number handed out
    std::uint64_t sequence = 0;  ///< Last FIFO sequence number handed out
};

class SyncStore {
public:
    virtual ~SyncStore() = default;

    virtual Result<void> save_item(const sync::SyncItem& item) = 0;
    virtual Result<void> remove_item(const std::string& item_id) = 0;
    virtual Result<void> save_vector(const sync::EntityRef& entity, const sync::VersionVector& vector) = 0;
    virtual Result<void> save_counters(const QueueCounters& counters) = 0;

    virtual Result<std::vector<sync::SyncItem>> load_items() const = 0;
    virtual Result<VectorTable> load_vectors() const = 0;
    virtual Result<QueueCounters> load_counters() const = 0;
};

} // namespace osync::store
