#pragma once

/**
 * @file memory_store.hpp
 * @brief Volatile SyncStore for tests and sessions that do not persist
 *
 * CONCURRENCY MODEL:
 * Reader-writer lock (std::shared_mutex). Loads take a shared lock, saves
 * and removals take the exclusive lock. In practice the engine is the only
 * writer and the UI thread may read concurrently.
 */

#include "osync/store/sync_store.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace osync::store {

class MemorySyncStore : public SyncStore {
public:
    MemorySyncStore() = default;

    Result<void> save_item(const sync::SyncItem& item) override {
        std::unique_lock lock(mutex_);
        items_.insert_or_assign(item.id(), item);
        return Ok();
    }

    Result<void> remove_item(const std::string& item_id) override {
        std::unique_lock lock(mutex_);
        items_.erase(item_id);
        return Ok();
    }

    Result<void> save_vector(const sync::EntityRef& entity, const sync::VersionVector& vector) override {
        std::unique_lock lock(mutex_);
        vectors_.insert_or_assign(entity, vector);
        return Ok();
    }

    Result<void> save_counters(const QueueCounters& counters) override {
        std::unique_lock lock(mutex_);
        counters_ = counters;
        return Ok();
    }

    /**
     * @return Items ordered by sequence number (FIFO order)
     */
    Result<std::vector<sync::SyncItem>> load_items() const override {
        std::shared_lock lock(mutex_);
        std::vector<sync::SyncItem> result;
        result.reserve(items_.size());
        for (const auto& [id, item] : items_) {
            result.push_back(item);
        }
        std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.sequence() < rhs.sequence();
        });
        return Ok(std::move(result));
    }

    Result<VectorTable> load_vectors() const override {
        std::shared_lock lock(mutex_);
        return Ok(vectors_);
    }

    Result<QueueCounters> load_counters() const override {
        std::shared_lock lock(mutex_);
        return Ok(counters_);
    }

    size_t item_count() const {
        std::shared_lock lock(mutex_);
        return items_.size();
    }

    bool contains(const std::string& item_id) const {
        std::shared_lock lock(mutex_);
        return items_.find(item_id) != items_.end();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, sync::SyncItem> items_;
    VectorTable vectors_;
    QueueCounters counters_;
};

} // namespace osync::store
