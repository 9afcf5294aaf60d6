#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/operation.hpp"
#include "osync/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace osync::sync {

/**
 * @brief Mutable bookkeeping carried next to a queued operation
 */
struct SyncItemState {
    SyncStatus status = SyncStatus::Pending;
    std::uint32_t retry_count = 0;
    FailureKind failure = FailureKind::None;
    std::string last_error;
    Timestamp next_attempt_at{};          ///< Not eligible before this instant (backoff)
    bool exhausted = false;               ///< Retry bound reached, terminally Failed
    std::optional<std::string> parent_id; ///< Set on conflict follow-ups
    std::optional<RemoteSnapshot> conflict_remote; ///< Remote side of the last detected conflict
    Timestamp updated_at{};
};

/**
 * @brief A queued operation plus its lifecycle status
 *
 * Owned and mutated only by SyncEngine. The sequence number fixes the
 * item's FIFO position among items of the same entity.
 */
class SyncItem {
public:
    SyncItem(std::string id, std::uint64_t sequence, SyncOperation operation);
    SyncItem(std::string id, std::uint64_t sequence, SyncOperation operation, SyncItemState state);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] const SyncOperation& operation() const noexcept { return operation_; }
    [[nodiscard]] const EntityRef& entity() const noexcept { return operation_.entity(); }
    [[nodiscard]] const SyncItemState& state() const noexcept { return state_; }
    [[nodiscard]] SyncStatus status() const noexcept { return state_.status; }
    [[nodiscard]] std::uint32_t retry_count() const noexcept { return state_.retry_count; }
    [[nodiscard]] bool is_follow_up() const noexcept { return state_.parent_id.has_value(); }

    /**
     * @brief Move to next_status if the state machine allows it
     *
     * Re-applying the current status is rejected too: every call must be a
     * real transition.
     */
    Result<void> advance(SyncStatus next_status, Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] static bool can_transition(SyncStatus from, SyncStatus to) noexcept;

    void replace_operation(SyncOperation operation) { operation_ = std::move(operation); }
    void record_failure(FailureKind kind, std::string message, Timestamp next_attempt_at);
    void increment_retry() { ++state_.retry_count; }
    void mark_exhausted() { state_.exhausted = true; }
    void set_parent(std::string parent_id) { state_.parent_id = std::move(parent_id); }
    void set_conflict_remote(RemoteSnapshot remote) { state_.conflict_remote = std::move(remote); }

private:
    std::string id_;
    std::uint64_t sequence_;
    SyncOperation operation_;
    SyncItemState state_;
};

} // namespace osync::sync
