#pragma once

#include "osync/core/config.hpp"
#include "osync/core/result.hpp"
#include "osync/events/event_bus.hpp"
#include "osync/events/events.hpp"
#include "osync/events/status_stream.hpp"
#include "osync/store/sync_store.hpp"
#include "osync/sync/conflict.hpp"
#include "osync/sync/item.hpp"
#include "osync/sync/operation.hpp"
#include "osync/sync/remote.hpp"
#include "osync/sync/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace osync::sync {

/**
 * @brief Current local state of an entity, for re-deriving superseded edits
 *
 * Returns nullopt when the entity no longer exists locally.
 */
using LocalStateProvider = std::function<std::optional<Payload>(const EntityRef&)>;

enum class ManualChoice {
    KeepLocal,   // Push the local version again on top of the remote one
    KeepRemote,  // Adopt the remote version
    UseMerged,   // Push a payload the user assembled
    Discard      // Drop the local change
};

struct ManualDecision {
    ManualChoice choice = ManualChoice::KeepRemote;
    Payload merged_payload;  ///< Only read for UseMerged

    static ManualDecision keep_local() { return {ManualChoice::KeepLocal, {}}; }
    static ManualDecision keep_remote() { return {ManualChoice::KeepRemote, {}}; }
    static ManualDecision use_merged(Payload payload) { return {ManualChoice::UseMerged, std::move(payload)}; }
    static ManualDecision discard() { return {ManualChoice::Discard, {}}; }
};

/**
 * @brief What a single run_cycle() did
 */
struct CycleReport {
    bool idle = true;
    std::string item_id;
    EntityRef entity;
    SyncStatus outcome = SyncStatus::Pending;  ///< Item status when the cycle ended
    std::string detail;

    [[nodiscard]] bool is_idle() const noexcept { return idle; }
};

/**
 * @brief Offline queue, reconciliation and conflict handling for one session
 *
 * Local edits go in through enqueue(); run_cycle() pushes one of them to
 * the remote service, comparing version vectors first. Everything that
 * happens is persisted through the SyncStore and published on the
 * EventBus.
 *
 * THREAD SAFETY:
 * All state sits behind one mutex. run_cycle() claims its item under the
 * lock, talks to the remote without it and re-locks to record the outcome,
 * so concurrent cycles never put two items of one entity in flight.
 * Events are emitted after the lock is released.
 */
class SyncEngine {
public:
    SyncEngine(EngineConfig config,
               RemoteService& remote,
               store::SyncStore& store,
               events::EventBus& bus,
               LocalStateProvider local_state = {});

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Queue a local edit made through the UI
     *
     * Bumps this node's counter in the entity's vector and coalesces with a
     * waiting item of the same entity when possible.
     *
     * @return Id of the item now carrying the edit
     */
    Result<std::string> enqueue(const EntityRef& entity,
                                OperationKind kind,
                                Payload payload,
                                Priority priority = Priority::Normal);

    /**
     * @brief Queue an operation built elsewhere (vector already assigned)
     */
    Result<std::string> enqueue(SyncOperation operation);

    /**
     * @brief Push the most urgent eligible item to the remote
     *
     * Also moves Failed items whose network backoff elapsed back to Pending.
     */
    CycleReport run_cycle();

    /**
     * @brief Run cycles until idle or max_cycles
     */
    std::vector<CycleReport> drain(std::size_t max_cycles = 1024);

    Result<void> retry(const std::string& item_id);
    Result<void> cancel(const std::string& item_id);
    Result<void> dismiss(const std::string& item_id);
    Result<void> resolve_manually(const std::string& item_id, const ManualDecision& decision);

    /**
     * @brief Live item, or a recently finished one from history
     */
    Result<SyncItem> item(const std::string& item_id) const;

    /**
     * @brief Live (non-terminal) items ordered by queue position
     */
    std::vector<SyncItem> items() const;

    std::size_t pending_count() const;
    VersionVector local_vector(const EntityRef& entity) const;
    std::vector<ConflictRecord> list_conflicts() const;

    /**
     * @brief Earliest backoff deadline among waiting items, if any
     */
    std::optional<Timestamp> next_wakeup() const;

    std::unique_ptr<events::StatusStream> subscribe_status(const EntityRef& entity);

    /**
     * @brief Reload the queue and vectors from the store
     *
     * Items persisted InFlight come back Failed (network): whether their
     * remote call landed is unknown, and the retry will find out.
     *
     * @return Number of items restored
     */
    Result<std::size_t> restore();

    ConflictResolver& resolver() noexcept { return resolver_; }
    const EngineConfig& config() const noexcept { return config_; }

private:
    using Outbox = std::vector<std::function<void()>>;

    struct Claim {
        std::string item_id;
        SyncOperation operation;
    };

    // Remote-side result of pushing a claimed item
    struct Exchange {
        std::optional<RemoteSnapshot> snapshot;
        std::optional<VersionVector> applied;
        std::optional<Error> error;
    };

    Timestamp now() const { return config_.clock(); }

    Result<std::string> enqueue_locked(SyncOperation operation, Outbox& out);
    SyncItem* coalesce_target_locked(const EntityRef& entity);
    SyncItem* select_locked(Timestamp current);
    bool is_ancestor_locked(const SyncItem& candidate, const std::string& other_id) const;
    void auto_retry_locked(Timestamp current, Outbox& out);

    Exchange exchange(const Claim& claim);
    CycleReport settle(const Claim& claim, Exchange exchange, Outbox& out, bool& rederive);
    CycleReport mark_synced_locked(SyncItem& item, const Exchange& exchange, Outbox& out);
    CycleReport mark_superseded_locked(SyncItem& item, const RemoteSnapshot& snapshot, Outbox& out);
    CycleReport mark_failed_locked(SyncItem& item, const Error& error, Outbox& out);
    CycleReport handle_conflict_locked(SyncItem& item, const RemoteSnapshot& snapshot, Outbox& out);

    std::string spawn_follow_up_locked(SyncItem& parent, SyncOperation follow_up,
                                       ConflictRecord record, Outbox& out);
    void complete_parent_locked(const SyncItem& child, bool succeeded, Outbox& out);
    void reopen_parent_locked(const SyncItem& child, Outbox& out);

    Result<void> transition_locked(SyncItem& item, SyncStatus to, const std::string& detail, Outbox& out);
    SyncItem retire_locked(std::string item_id);
    VersionVector local_vector_locked(const EntityRef& entity) const;
    void adopt_vector_locked(const EntityRef& entity, const VersionVector& vector);
    void persist_locked(const SyncItem& item);
    void persist_counters_locked();
    Timestamp backoff_deadline(const SyncItem& item, Timestamp current) const;

    Result<SyncItem*> find_item(const std::string& item_id);
    Result<const SyncItem*> find_item(const std::string& item_id) const;
    ConflictRecord placeholder_record(const SyncItem& item) const;

    template<typename EventType>
    void post(Outbox& out, EventType event) {
        out.emplace_back([this, event = std::move(event)]() { bus_.emit(event); });
    }
    static void publish(Outbox& out);

    EngineConfig config_;
    RemoteService& remote_;
    store::SyncStore& store_;
    events::EventBus& bus_;
    LocalStateProvider local_state_;
    ConflictResolver resolver_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SyncItem> items_;
    std::deque<SyncItem> history_;
    std::map<EntityRef, VersionVector> vectors_;
    std::unordered_map<EntityRef, Payload, EntityRefHash> bases_;
    std::unordered_set<EntityRef, EntityRefHash> in_flight_;
    std::unordered_map<std::string, ConflictRecord> settled_conflicts_;  ///< Parents waiting on a follow-up
    std::uint64_t item_counter_ = 0;
    std::uint64_t sequence_counter_ = 0;
};

} // namespace osync::sync
