#pragma once

#include "osync/store/sync_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>

namespace osync::store {

/**
 * @brief SyncStore kept in a single JSON document on disk
 *
 * Layout:
 * {
 *   "format": 1,
 *   "items":   { "<item id>": { ...item... } },
 *   "vectors": [ { "entity": {"type": ..., "id": ...}, "vector": {"A": 1} } ],
 *   "counters": { "item": 12, "sequence": 12 }
 * }
 *
 * "counters" is optional on load; a document without it reads as zeros.
 *
 * Every mutation rewrites the whole document to "<path>.tmp" and renames it
 * over the original, so a crash leaves either the old or the new state.
 */
class JsonFileSyncStore : public SyncStore {
public:
    /**
     * @brief Open (or create) the store at path
     *
     * Fails with StorageFailure when an existing file is not a valid store
     * document.
     */
    static Result<std::unique_ptr<JsonFileSyncStore>> open(std::filesystem::path path);

    Result<void> save_item(const sync::SyncItem& item) override;
    Result<void> remove_item(const std::string& item_id) override;
    Result<void> save_vector(const sync::EntityRef& entity, const sync::VersionVector& vector) override;
    Result<void> save_counters(const QueueCounters& counters) override;

    Result<std::vector<sync::SyncItem>> load_items() const override;
    Result<VectorTable> load_vectors() const override;
    Result<QueueCounters> load_counters() const override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    JsonFileSyncStore(std::filesystem::path path, nlohmann::json document);

    Result<void> flush_locked() const;

    std::filesystem::path path_;
    nlohmann::json document_;
    mutable std::mutex mutex_;
};

} // namespace osync::store
