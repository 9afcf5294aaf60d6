#include "osync/sync/item.hpp"

namespace osync::sync {
namespace {

bool allowed(SyncStatus from, SyncStatus to) noexcept {
    switch (from) {
        case SyncStatus::Pending:
            return to == SyncStatus::InFlight || to == SyncStatus::Dismissed;
        case SyncStatus::InFlight:
            return to == SyncStatus::Synced || to == SyncStatus::Failed ||
                   to == SyncStatus::Conflicted || to == SyncStatus::Superseded;
        case SyncStatus::Failed:
            return to == SyncStatus::Pending || to == SyncStatus::Dismissed;
        case SyncStatus::Conflicted:
            return to == SyncStatus::Synced || to == SyncStatus::ManualPending;
        case SyncStatus::ManualPending:
            return to == SyncStatus::Synced || to == SyncStatus::Dismissed;
        case SyncStatus::Synced:
        case SyncStatus::Superseded:
        case SyncStatus::Dismissed:
            return false;
    }
    return false;
}

} // namespace

SyncItem::SyncItem(std::string id, std::uint64_t sequence, SyncOperation operation)
    : id_(std::move(id)), sequence_(sequence), operation_(std::move(operation)) {
    state_.updated_at = operation_.created_at();
}

SyncItem::SyncItem(std::string id, std::uint64_t sequence, SyncOperation operation, SyncItemState state)
    : id_(std::move(id)), sequence_(sequence), operation_(std::move(operation)), state_(std::move(state)) {}

bool SyncItem::can_transition(SyncStatus from, SyncStatus to) noexcept {
    return allowed(from, to);
}

Result<void> SyncItem::advance(SyncStatus next_status, Timestamp now) {
    if (!can_transition(state_.status, next_status)) {
        return Err<void>(make_error(ErrorCode::IllegalTransition,
                                    std::string("Illegal transition ") + to_string(state_.status) +
                                    " -> " + to_string(next_status) + " for " + id_));
    }
    state_.status = next_status;
    state_.updated_at = now;
    if (next_status != SyncStatus::Failed) {
        state_.failure = FailureKind::None;
    }
    return Ok();
}

void SyncItem::record_failure(FailureKind kind, std::string message, Timestamp next_attempt_at) {
    state_.failure = kind;
    state_.last_error = std::move(message);
    state_.next_attempt_at = next_attempt_at;
}

} // namespace osync::sync
