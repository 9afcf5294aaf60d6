#include "osync/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace osync::sync {
namespace {

constexpr const char* kItemPrefix = "item-";

std::string make_item_id(std::uint64_t counter) {
    return kItemPrefix + std::to_string(counter);
}

// Numeric suffix of an "item-N" id, 0 for ids minted elsewhere
std::uint64_t item_counter_of(const std::string& id) {
    const std::string prefix(kItemPrefix);
    if (id.compare(0, prefix.size(), prefix) != 0 || id.size() == prefix.size()) {
        return 0;
    }
    const auto digits = id.substr(prefix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return 0;
    }
    return std::strtoull(digits.c_str(), nullptr, 10);
}

bool services_before(const SyncItem& lhs, const SyncItem& rhs) {
    const auto& a = lhs.operation();
    const auto& b = rhs.operation();
    if (a.priority() != b.priority()) {
        return a.priority() > b.priority();
    }
    if (a.created_at() != b.created_at()) {
        return a.created_at() < b.created_at();
    }
    return lhs.sequence() < rhs.sequence();
}

// Remote state after our operation landed on top of snapshot
std::optional<Payload> base_after_apply(const SyncOperation& operation,
                                        const std::optional<RemoteSnapshot>& snapshot) {
    if (operation.kind() == OperationKind::Delete) {
        return std::nullopt;
    }
    Payload base = (snapshot && !snapshot->deleted) ? snapshot->data : Payload();
    if (operation.kind() == OperationKind::Update && base.is_object() && operation.payload().is_object()) {
        base.update(operation.payload());
        return base;
    }
    return operation.payload();
}

} // namespace

SyncEngine::SyncEngine(EngineConfig config,
                       RemoteService& remote,
                       store::SyncStore& store,
                       events::EventBus& bus,
                       LocalStateProvider local_state)
    : config_(std::move(config)),
      remote_(remote),
      store_(store),
      bus_(bus),
      local_state_(std::move(local_state)) {
    auto valid = validate_engine_config(config_);
    if (valid.is_error()) {
        throw std::invalid_argument(valid.error().message);
    }
    if (config_.superseded_policy == SupersededPolicy::Rederive && !local_state_) {
        spdlog::warn("Superseded policy is rederive but no local state provider was given; "
                     "superseded operations will be discarded");
    }
}

// ════════════════════════════════════════════════════════
// Queue
// ════════════════════════════════════════════════════════

Result<std::string> SyncEngine::enqueue(const EntityRef& entity,
                                        OperationKind kind,
                                        Payload payload,
                                        Priority priority) {
    Outbox out;
    auto result = [&]() -> Result<std::string> {
        std::lock_guard lock(mutex_);
        auto vector = local_vector_locked(entity).increment(config_.node_id);
        auto operation = SyncOperation::create(entity, kind, std::move(payload), priority,
                                               std::move(vector), config_.node_id, now());
        if (operation.is_error()) {
            return Err<std::string>(operation.error());
        }
        return enqueue_locked(std::move(operation.value()), out);
    }();
    publish(out);
    return result;
}

Result<std::string> SyncEngine::enqueue(SyncOperation operation) {
    Outbox out;
    auto result = [&]() -> Result<std::string> {
        std::lock_guard lock(mutex_);
        return enqueue_locked(std::move(operation), out);
    }();
    publish(out);
    return result;
}

Result<std::string> SyncEngine::enqueue_locked(SyncOperation operation, Outbox& out) {
    const auto entity = operation.entity();
    const auto vector = operation.vector();

    if (auto* target = coalesce_target_locked(entity)) {
        auto previous = target->operation();
        target->replace_operation(previous.coalesce(operation));
        auto saved = store_.save_item(*target);
        if (saved.is_error()) {
            spdlog::error("Could not persist coalesced item {}: {}", target->id(), saved.error().message);
            target->replace_operation(std::move(previous));
            return Err<std::string>(saved.error());
        }
        adopt_vector_locked(entity, vector);
        post(out, events::OperationCoalescedEvent{target->id(), entity, target->operation().kind(), now()});
        return Ok(target->id());
    }

    const auto id = make_item_id(item_counter_ + 1);
    SyncItem item(id, sequence_counter_ + 1, std::move(operation));
    auto saved = store_.save_item(item);
    if (saved.is_error()) {
        spdlog::error("Could not persist new item for {}: {}", entity.to_string(), saved.error().message);
        return Err<std::string>(saved.error());
    }
    ++item_counter_;
    ++sequence_counter_;
    persist_counters_locked();

    post(out, events::ItemEnqueuedEvent{id, entity, item.operation().kind(), item.operation().priority(), now()});
    items_.emplace(id, std::move(item));
    adopt_vector_locked(entity, vector);
    return Ok(id);
}

SyncItem* SyncEngine::coalesce_target_locked(const EntityRef& entity) {
    // Only the newest live item of the entity may absorb an edit, otherwise
    // the edit would jump ahead of an older item still waiting
    SyncItem* newest = nullptr;
    for (auto& [id, item] : items_) {
        if (item.entity() != entity) {
            continue;
        }
        if (!newest || item.sequence() > newest->sequence()) {
            newest = &item;
        }
    }
    if (!newest || newest->status() != SyncStatus::Pending || newest->is_follow_up()) {
        return nullptr;
    }
    return newest;
}

// ════════════════════════════════════════════════════════
// Cycle
// ════════════════════════════════════════════════════════

CycleReport SyncEngine::run_cycle() {
    Outbox out;
    std::optional<Claim> claim;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        auto_retry_locked(current, out);
        if (auto* item = select_locked(current)) {
            auto moved = transition_locked(*item, SyncStatus::InFlight, "", out);
            if (moved.is_ok()) {
                in_flight_.insert(item->entity());
                claim = Claim{item->id(), item->operation()};
            }
        }
    }
    publish(out);

    if (!claim) {
        spdlog::debug("Sync cycle idle");
        return CycleReport{};
    }
    spdlog::debug("Sync cycle claimed {} ({} {})", claim->item_id,
                  to_string(claim->operation.kind()), claim->operation.entity().to_string());

    auto result = exchange(*claim);

    bool rederive = false;
    CycleReport report;
    {
        std::lock_guard lock(mutex_);
        report = settle(*claim, std::move(result), out, rederive);
    }
    publish(out);

    if (rederive) {
        const auto& entity = claim->operation.entity();
        auto state = local_state_(entity);
        if (state && !is_empty_payload(*state)) {
            auto requeued = enqueue(entity, OperationKind::Update, std::move(*state), claim->operation.priority());
            if (requeued.is_error()) {
                spdlog::warn("Could not re-derive superseded {}: {}", entity.to_string(), requeued.error().message);
            } else {
                spdlog::info("Re-derived superseded {} as {}", entity.to_string(), requeued.value());
            }
        }
    }
    return report;
}

std::vector<CycleReport> SyncEngine::drain(std::size_t max_cycles) {
    std::vector<CycleReport> reports;
    for (std::size_t i = 0; i < max_cycles; ++i) {
        auto report = run_cycle();
        if (report.is_idle()) {
            break;
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

SyncItem* SyncEngine::select_locked(Timestamp current) {
    SyncItem* best = nullptr;
    for (auto& [id, item] : items_) {
        if (item.status() != SyncStatus::Pending ||
            item.state().next_attempt_at > current ||
            in_flight_.count(item.entity()) > 0) {
            continue;
        }

        bool blocked = false;
        for (const auto& [other_id, other] : items_) {
            if (other_id == id || other.entity() != item.entity()) {
                continue;
            }
            if (other.sequence() < item.sequence() ||
                (other.sequence() == item.sequence() && !is_ancestor_locked(item, other_id))) {
                blocked = true;
                break;
            }
        }
        if (blocked) {
            continue;
        }

        if (!best || services_before(item, *best)) {
            best = &item;
        }
    }
    return best;
}

bool SyncEngine::is_ancestor_locked(const SyncItem& candidate, const std::string& other_id) const {
    auto parent = candidate.state().parent_id;
    while (parent) {
        if (*parent == other_id) {
            return true;
        }
        const auto it = items_.find(*parent);
        if (it == items_.end()) {
            return false;
        }
        parent = it->second.state().parent_id;
    }
    return false;
}

void SyncEngine::auto_retry_locked(Timestamp current, Outbox& out) {
    for (auto& [id, item] : items_) {
        const auto& state = item.state();
        if (item.status() != SyncStatus::Failed || state.failure != FailureKind::Network ||
            state.exhausted || state.next_attempt_at > current) {
            continue;
        }
        if (item.retry_count() >= config_.max_retries) {
            item.mark_exhausted();
            persist_locked(item);
            spdlog::warn("Item {} exhausted its {} retries", id, config_.max_retries);
            continue;
        }
        item.increment_retry();
        if (transition_locked(item, SyncStatus::Pending, "automatic retry", out).is_error()) {
            continue;
        }
    }
}

SyncEngine::Exchange SyncEngine::exchange(const Claim& claim) {
    Exchange result;
    const auto& operation = claim.operation;
    const auto& entity = operation.entity();

    auto deadline = now() + config_.remote_timeout;
    auto fetched = remote_.fetch_remote(entity, deadline);
    if (now() > deadline) {
        result.error = make_error(ErrorCode::NetworkFailure, "Fetching " + entity.to_string() + " exceeded its deadline");
        return result;
    }
    if (fetched.is_error()) {
        result.error = fetched.error();
        return result;
    }
    result.snapshot = std::move(fetched.value());

    if (result.snapshot && operation.vector().compare(result.snapshot->vector) != VectorOrdering::Dominates) {
        return result;
    }

    deadline = now() + config_.remote_timeout;
    auto applied = remote_.apply_remote(operation, deadline);
    if (now() > deadline) {
        result.error = make_error(ErrorCode::NetworkFailure, "Applying " + claim.item_id + " exceeded its deadline");
        return result;
    }
    if (applied.is_ok()) {
        result.applied = std::move(applied.value());
        return result;
    }
    if (applied.error().code != ErrorCode::Concurrent) {
        result.error = applied.error();
        return result;
    }

    spdlog::warn("Remote reported a concurrent version of {} while applying {}, refetching",
                 entity.to_string(), claim.item_id);
    deadline = now() + config_.remote_timeout;
    auto refetched = remote_.fetch_remote(entity, deadline);
    if (now() > deadline) {
        result.error = make_error(ErrorCode::NetworkFailure, "Refetching " + entity.to_string() + " exceeded its deadline");
        return result;
    }
    if (refetched.is_error()) {
        result.error = refetched.error();
        return result;
    }
    result.snapshot = std::move(refetched.value());
    return result;
}

CycleReport SyncEngine::settle(const Claim& claim, Exchange exchange, Outbox& out, bool& rederive) {
    in_flight_.erase(claim.operation.entity());

    auto found = find_item(claim.item_id);
    if (found.is_error()) {
        spdlog::error("Claimed item vanished: {}", found.error().message);
        return CycleReport{false, claim.item_id, claim.operation.entity(), SyncStatus::InFlight, found.error().message};
    }
    auto& item = *found.value();

    if (exchange.error) {
        return mark_failed_locked(item, *exchange.error, out);
    }
    if (exchange.applied) {
        return mark_synced_locked(item, exchange, out);
    }
    if (!exchange.snapshot) {
        return mark_failed_locked(item, make_error(ErrorCode::NetworkFailure,
                                                   "Remote reported a conflict on a missing entity"), out);
    }

    const auto& snapshot = *exchange.snapshot;
    switch (item.operation().vector().compare(snapshot.vector)) {
        case VectorOrdering::Equal:
            return mark_synced_locked(item, exchange, out);
        case VectorOrdering::Dominated:
            rederive = config_.superseded_policy == SupersededPolicy::Rederive &&
                       local_state_ && !snapshot.deleted && !item.is_follow_up();
            return mark_superseded_locked(item, snapshot, out);
        case VectorOrdering::Concurrent:
            return handle_conflict_locked(item, snapshot, out);
        case VectorOrdering::Dominates:
            break;
    }
    return mark_failed_locked(item, make_error(ErrorCode::NetworkFailure,
                                               "Remote reported a conflict the versions do not show"), out);
}

CycleReport SyncEngine::mark_synced_locked(SyncItem& item, const Exchange& exchange, Outbox& out) {
    const auto& entity = item.entity();
    std::string detail;
    if (exchange.applied) {
        adopt_vector_locked(entity, item.operation().vector().merge(*exchange.applied));
        auto base = base_after_apply(item.operation(), exchange.snapshot);
        if (base) {
            bases_.insert_or_assign(entity, std::move(*base));
        } else {
            bases_.erase(entity);
        }
        detail = "applied";
    } else {
        // Equal vectors: an earlier apply landed but its answer was lost
        adopt_vector_locked(entity, exchange.snapshot->vector);
        bases_.insert_or_assign(entity, exchange.snapshot->data);
        detail = "remote already current";
    }

    transition_locked(item, SyncStatus::Synced, detail, out);
    CycleReport report{false, item.id(), entity, item.status(), detail};
    complete_parent_locked(retire_locked(item.id()), true, out);
    return report;
}

CycleReport SyncEngine::mark_superseded_locked(SyncItem& item, const RemoteSnapshot& snapshot, Outbox& out) {
    const auto entity = item.entity();
    adopt_vector_locked(entity, snapshot.vector);
    if (snapshot.deleted) {
        bases_.erase(entity);
    } else {
        bases_.insert_or_assign(entity, snapshot.data);
    }

    const std::string detail = "remote " + snapshot.vector.to_string() + " is newer";
    transition_locked(item, SyncStatus::Superseded, detail, out);
    post(out, events::RemoteAdoptedEvent{entity, snapshot, now()});

    CycleReport report{false, item.id(), entity, item.status(), detail};
    complete_parent_locked(retire_locked(item.id()), true, out);
    return report;
}

CycleReport SyncEngine::mark_failed_locked(SyncItem& item, const Error& error, Outbox& out) {
    const auto current = now();
    if (error.code == ErrorCode::Rejected) {
        item.record_failure(FailureKind::Rejected, error.message, current);
        transition_locked(item, SyncStatus::Failed, error.message, out);
        return CycleReport{false, item.id(), item.entity(), item.status(), error.message};
    }

    const auto next_attempt = backoff_deadline(item, current);
    item.record_failure(FailureKind::Network, error.message, next_attempt);
    if (item.retry_count() >= config_.max_retries) {
        item.mark_exhausted();
    }
    transition_locked(item, SyncStatus::Failed, error.message, out);

    if (item.state().exhausted) {
        spdlog::warn("Item {} failed after {} retries, giving up: {}", item.id(), item.retry_count(), error.message);
    } else {
        post(out, events::RetryScheduledEvent{item.id(), item.entity(), item.retry_count(),
                                              next_attempt, error.message, current});
    }
    return CycleReport{false, item.id(), item.entity(), item.status(), error.message};
}

CycleReport SyncEngine::handle_conflict_locked(SyncItem& item, const RemoteSnapshot& snapshot, Outbox& out) {
    const auto entity = item.entity();
    const auto current = now();

    item.set_conflict_remote(snapshot);
    transition_locked(item, SyncStatus::Conflicted, "concurrent with remote " + snapshot.vector.to_string(), out);
    post(out, events::ConflictDetectedEvent{item.id(), entity, item.operation().vector(), snapshot.vector, current});

    std::optional<Payload> base;
    if (const auto it = bases_.find(entity); it != bases_.end()) {
        base = it->second;
    }
    if (snapshot.deleted) {
        bases_.erase(entity);
    } else {
        bases_.insert_or_assign(entity, snapshot.data);
    }

    auto resolved = resolver_.resolve(item.id(), item.operation(), snapshot, base, current);
    if (resolved.is_error()) {
        spdlog::error("Conflict resolution for {} failed: {}", item.id(), resolved.error().message);
        auto record = placeholder_record(item);
        record.remote = snapshot;
        resolved = Ok(ResolutionOutcome{std::move(record), std::nullopt,
                                        item.operation().vector().merge(snapshot.vector)});
    }

    auto outcome = std::move(resolved.value());
    const auto resolution = outcome.record.resolution.value_or(Resolution{});
    const auto& rule = resolution.rule;

    switch (resolution.kind) {
        case ResolutionKind::ManualPending: {
            transition_locked(item, SyncStatus::ManualPending, rule, out);
            resolver_.open(std::move(outcome.record));
            post(out, events::ConflictResolvedEvent{item.id(), entity, resolution.kind, rule, std::nullopt, current});
            return CycleReport{false, item.id(), entity, item.status(), rule};
        }
        case ResolutionKind::RemoteWins: {
            adopt_vector_locked(entity, outcome.merged_vector);
            transition_locked(item, SyncStatus::Synced, rule, out);
            post(out, events::RemoteAdoptedEvent{entity, snapshot, current});
            post(out, events::ConflictResolvedEvent{item.id(), entity, resolution.kind, rule, std::nullopt, current});
            CycleReport report{false, item.id(), entity, item.status(), rule};
            complete_parent_locked(retire_locked(item.id()), true, out);
            return report;
        }
        case ResolutionKind::LocalWins:
        case ResolutionKind::Merged:
            break;
    }

    if (!outcome.follow_up) {
        spdlog::error("Resolution {} for {} carries no follow-up", to_string(resolution.kind), item.id());
        return CycleReport{false, item.id(), entity, item.status(), rule};
    }
    adopt_vector_locked(entity, outcome.merged_vector);
    const auto follow_up_id = spawn_follow_up_locked(item, std::move(*outcome.follow_up),
                                                     std::move(outcome.record), out);
    post(out, events::ConflictResolvedEvent{item.id(), entity, resolution.kind, rule, follow_up_id, current});
    return CycleReport{false, item.id(), entity, item.status(), rule};
}

// ════════════════════════════════════════════════════════
// Follow-ups
// ════════════════════════════════════════════════════════

std::string SyncEngine::spawn_follow_up_locked(SyncItem& parent, SyncOperation follow_up,
                                               ConflictRecord record, Outbox& out) {
    const auto id = make_item_id(++item_counter_);
    persist_counters_locked();
    SyncItem item(id, parent.sequence(), std::move(follow_up));
    item.set_parent(parent.id());
    persist_locked(item);

    post(out, events::ItemEnqueuedEvent{id, item.entity(), item.operation().kind(),
                                        item.operation().priority(), now()});
    settled_conflicts_.insert_or_assign(parent.id(), std::move(record));
    items_.emplace(id, std::move(item));
    return id;
}

void SyncEngine::complete_parent_locked(const SyncItem& child, bool succeeded, Outbox& out) {
    if (!child.is_follow_up()) {
        return;
    }
    auto found = find_item(*child.state().parent_id);
    if (found.is_error()) {
        spdlog::debug("Parent of follow-up {} already finished", child.id());
        return;
    }
    auto& parent = *found.value();
    const auto detail = "follow-up " + child.id() + " " + to_string(child.status());

    if (succeeded) {
        if (transition_locked(parent, SyncStatus::Synced, detail, out).is_error()) {
            return;
        }
    } else {
        if (parent.status() == SyncStatus::Conflicted &&
            transition_locked(parent, SyncStatus::ManualPending, detail, out).is_error()) {
            return;
        }
        if (transition_locked(parent, SyncStatus::Dismissed, detail, out).is_error()) {
            return;
        }
    }
    complete_parent_locked(retire_locked(parent.id()), succeeded, out);
}

void SyncEngine::reopen_parent_locked(const SyncItem& child, Outbox& out) {
    if (!child.is_follow_up()) {
        return;
    }
    auto found = find_item(*child.state().parent_id);
    if (found.is_error()) {
        return;
    }
    auto& parent = *found.value();

    if (parent.status() == SyncStatus::Conflicted &&
        transition_locked(parent, SyncStatus::ManualPending, "follow-up " + child.id() + " dismissed", out).is_error()) {
        return;
    }

    auto record = placeholder_record(parent);
    if (auto it = settled_conflicts_.find(parent.id()); it != settled_conflicts_.end()) {
        record = std::move(it->second);
        settled_conflicts_.erase(it);
    }
    record.resolution = Resolution{ResolutionKind::ManualPending, {}, "follow-up dismissed"};
    resolver_.open(std::move(record));
    post(out, events::ConflictResolvedEvent{parent.id(), parent.entity(), ResolutionKind::ManualPending,
                                            "follow-up dismissed", std::nullopt, now()});
}

// ════════════════════════════════════════════════════════
// User actions
// ════════════════════════════════════════════════════════

Result<void> SyncEngine::retry(const std::string& item_id) {
    Outbox out;
    auto result = [&]() -> Result<void> {
        std::lock_guard lock(mutex_);
        auto found = find_item(item_id);
        if (found.is_error()) {
            return Err<void>(found.error());
        }
        auto& item = *found.value();
        if (item.status() != SyncStatus::Failed) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        "Only Failed items can be retried; " + item_id + " is " +
                                        to_string(item.status())));
        }
        if (item.state().exhausted || item.retry_count() >= config_.max_retries) {
            if (!item.state().exhausted) {
                item.mark_exhausted();
                persist_locked(item);
            }
            return Err<void>(make_error(ErrorCode::RetryExhausted,
                                        item_id + " reached " + std::to_string(config_.max_retries) + " retries"));
        }

        item.increment_retry();
        item.record_failure(item.state().failure, item.state().last_error, now());
        return transition_locked(item, SyncStatus::Pending, "retry requested", out);
    }();
    publish(out);
    return result;
}

Result<void> SyncEngine::cancel(const std::string& item_id) {
    Outbox out;
    auto result = [&]() -> Result<void> {
        std::lock_guard lock(mutex_);
        auto found = find_item(item_id);
        if (found.is_error()) {
            return Err<void>(found.error());
        }
        auto& item = *found.value();
        if (item.is_follow_up()) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        item_id + " resolves a conflict and cannot be cancelled"));
        }
        if (item.status() != SyncStatus::Pending) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        "Only Pending items can be cancelled; " + item_id + " is " +
                                        to_string(item.status())));
        }
        auto moved = transition_locked(item, SyncStatus::Dismissed, "cancelled", out);
        if (moved.is_ok()) {
            retire_locked(item_id);
        }
        return moved;
    }();
    publish(out);
    return result;
}

Result<void> SyncEngine::dismiss(const std::string& item_id) {
    Outbox out;
    auto result = [&]() -> Result<void> {
        std::lock_guard lock(mutex_);
        auto found = find_item(item_id);
        if (found.is_error()) {
            return Err<void>(found.error());
        }
        auto& item = *found.value();
        const auto status = item.status();
        if (status != SyncStatus::Failed && status != SyncStatus::ManualPending) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        "Only Failed or ManualPending items can be dismissed; " + item_id +
                                        " is " + to_string(status)));
        }
        if (status == SyncStatus::ManualPending) {
            const bool has_follow_up = std::any_of(items_.begin(), items_.end(), [&](const auto& entry) {
                return entry.second.state().parent_id == item_id;
            });
            if (has_follow_up) {
                return Err<void>(make_error(ErrorCode::IllegalTransition,
                                            item_id + " has a follow-up in progress"));
            }
            auto taken = resolver_.take_pending(item_id);
            if (taken.is_error()) {
                spdlog::debug("Dismissing {} without an open conflict record", item_id);
            }
        }

        auto moved = transition_locked(item, SyncStatus::Dismissed, "dismissed", out);
        if (moved.is_error()) {
            return moved;
        }
        const auto retired = retire_locked(item_id);
        if (status == SyncStatus::Failed) {
            reopen_parent_locked(retired, out);
        } else {
            complete_parent_locked(retired, false, out);
        }
        return moved;
    }();
    publish(out);
    return result;
}

Result<void> SyncEngine::resolve_manually(const std::string& item_id, const ManualDecision& decision) {
    Outbox out;
    auto result = [&]() -> Result<void> {
        std::lock_guard lock(mutex_);
        auto found = find_item(item_id);
        if (found.is_error()) {
            return Err<void>(found.error());
        }
        auto& item = *found.value();
        if (item.status() != SyncStatus::ManualPending) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        item_id + " is " + to_string(item.status()) + ", not manual_pending"));
        }
        if (decision.choice == ManualChoice::UseMerged && is_empty_payload(decision.merged_payload)) {
            return Err<void>(make_error(ErrorCode::InvalidPayload, "Merged payload for " + item_id + " is empty"));
        }

        auto taken = resolver_.take_pending(item_id);
        if (taken.is_error()) {
            return Err<void>(make_error(ErrorCode::IllegalTransition,
                                        item_id + " has no open conflict; a follow-up is already in progress"));
        }
        auto record = std::move(taken.value());
        const auto& entity = item.entity();
        const auto& local = item.operation();
        const auto merged = local.vector().merge(record.remote.vector);
        const auto current = now();

        switch (decision.choice) {
            case ManualChoice::KeepLocal:
            case ManualChoice::UseMerged: {
                const bool keep_local = decision.choice == ManualChoice::KeepLocal;
                auto follow_up = keep_local
                    ? local.rebased(local.kind(), local.payload(), merged, Priority::Critical, current)
                    : local.rebased(OperationKind::Update, decision.merged_payload, merged, Priority::Critical, current);
                const auto kind = keep_local ? ResolutionKind::LocalWins : ResolutionKind::Merged;
                record.resolution = Resolution{kind, keep_local ? Payload() : decision.merged_payload, "manual"};

                adopt_vector_locked(entity, merged);
                const auto follow_up_id = spawn_follow_up_locked(item, std::move(follow_up), std::move(record), out);
                post(out, events::ConflictResolvedEvent{item_id, entity, kind, "manual", follow_up_id, current});
                return Ok();
            }
            case ManualChoice::KeepRemote: {
                adopt_vector_locked(entity, record.remote.vector);
                auto moved = transition_locked(item, SyncStatus::Synced, "kept remote", out);
                if (moved.is_error()) {
                    return moved;
                }
                post(out, events::RemoteAdoptedEvent{entity, record.remote, current});
                post(out, events::ConflictResolvedEvent{item_id, entity, ResolutionKind::RemoteWins,
                                                        "manual", std::nullopt, current});
                complete_parent_locked(retire_locked(item_id), true, out);
                return Ok();
            }
            case ManualChoice::Discard: {
                adopt_vector_locked(entity, record.remote.vector);
                auto moved = transition_locked(item, SyncStatus::Dismissed, "local change discarded", out);
                if (moved.is_error()) {
                    return moved;
                }
                post(out, events::ConflictResolvedEvent{item_id, entity, ResolutionKind::RemoteWins,
                                                        "manual discard", std::nullopt, current});
                complete_parent_locked(retire_locked(item_id), false, out);
                return Ok();
            }
        }
        return Err<void>(make_error(ErrorCode::InvalidPayload, "Unknown manual decision"));
    }();
    publish(out);
    return result;
}

// ════════════════════════════════════════════════════════
// Inspection
// ════════════════════════════════════════════════════════

Result<SyncItem> SyncEngine::item(const std::string& item_id) const {
    std::lock_guard lock(mutex_);
    auto found = find_item(item_id);
    if (found.is_ok()) {
        return Ok(*found.value());
    }
    const auto it = std::find_if(history_.rbegin(), history_.rend(),
                                 [&](const SyncItem& entry) { return entry.id() == item_id; });
    if (it == history_.rend()) {
        return Err<SyncItem>(found.error());
    }
    return Ok(*it);
}

std::vector<SyncItem> SyncEngine::items() const {
    std::lock_guard lock(mutex_);
    std::vector<SyncItem> result;
    result.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        result.push_back(item);
    }
    std::sort(result.begin(), result.end(), [](const SyncItem& lhs, const SyncItem& rhs) {
        if (lhs.sequence() != rhs.sequence()) {
            return lhs.sequence() < rhs.sequence();
        }
        return item_counter_of(lhs.id()) < item_counter_of(rhs.id());
    });
    return result;
}

std::size_t SyncEngine::pending_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const auto& entry) {
        return entry.second.status() == SyncStatus::Pending;
    }));
}

VersionVector SyncEngine::local_vector(const EntityRef& entity) const {
    std::lock_guard lock(mutex_);
    return local_vector_locked(entity);
}

VersionVector SyncEngine::local_vector_locked(const EntityRef& entity) const {
    const auto it = vectors_.find(entity);
    return it == vectors_.end() ? VersionVector{} : it->second;
}

std::vector<ConflictRecord> SyncEngine::list_conflicts() const {
    return resolver_.list_pending();
}

std::optional<Timestamp> SyncEngine::next_wakeup() const {
    std::lock_guard lock(mutex_);
    std::optional<Timestamp> earliest;
    for (const auto& [id, item] : items_) {
        const auto& state = item.state();
        const bool waiting = item.status() == SyncStatus::Pending ||
                             (item.status() == SyncStatus::Failed && state.failure == FailureKind::Network &&
                              !state.exhausted);
        if (waiting && (!earliest || state.next_attempt_at < *earliest)) {
            earliest = state.next_attempt_at;
        }
    }
    return earliest;
}

std::unique_ptr<events::StatusStream> SyncEngine::subscribe_status(const EntityRef& entity) {
    return std::make_unique<events::StatusStream>(bus_, entity);
}

// ════════════════════════════════════════════════════════
// Persistence
// ════════════════════════════════════════════════════════

Result<std::size_t> SyncEngine::restore() {
    std::lock_guard lock(mutex_);
    auto vectors = store_.load_vectors();
    if (vectors.is_error()) {
        return Err<std::size_t>(vectors.error());
    }
    auto loaded = store_.load_items();
    if (loaded.is_error()) {
        return Err<std::size_t>(loaded.error());
    }
    auto counters = store_.load_counters();
    if (counters.is_error()) {
        return Err<std::size_t>(counters.error());
    }
    item_counter_ = std::max(item_counter_, counters.value().item);
    sequence_counter_ = std::max(sequence_counter_, counters.value().sequence);

    for (const auto& [entity, vector] : vectors.value()) {
        vectors_.insert_or_assign(entity, local_vector_locked(entity).merge(vector));
    }

    const auto current = now();
    std::size_t restored = 0;
    std::size_t interrupted = 0;
    for (auto& item : loaded.value()) {
        if (items_.count(item.id()) > 0) {
            continue;
        }
        item_counter_ = std::max(item_counter_, item_counter_of(item.id()));
        sequence_counter_ = std::max(sequence_counter_, item.sequence());

        if (item.status() == SyncStatus::InFlight) {
            item.record_failure(FailureKind::Network, "interrupted before the remote answered", current);
            auto moved = item.advance(SyncStatus::Failed, current);
            if (moved.is_error()) {
                spdlog::error("{}", moved.error().message);
            } else {
                persist_locked(item);
                ++interrupted;
            }
        } else if (item.status() == SyncStatus::ManualPending) {
            resolver_.open(placeholder_record(item));
        }

        items_.emplace(item.id(), std::move(item));
        ++restored;
    }

    spdlog::info("Restored {} items ({} interrupted in flight) and {} entity vectors",
                 restored, interrupted, vectors.value().size());
    return Ok(restored);
}

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

Result<void> SyncEngine::transition_locked(SyncItem& item, SyncStatus to, const std::string& detail, Outbox& out) {
    const auto from = item.status();
    auto moved = item.advance(to, now());
    if (moved.is_error()) {
        spdlog::error("{}", moved.error().message);
        return moved;
    }
    persist_locked(item);
    post(out, events::SyncStatusChangedEvent{item.id(), item.entity(), from, to, detail, item.state().updated_at});
    return moved;
}

SyncItem SyncEngine::retire_locked(std::string item_id) {
    auto node = items_.extract(item_id);
    SyncItem retired = std::move(node.mapped());
    settled_conflicts_.erase(item_id);

    auto removed = store_.remove_item(item_id);
    if (removed.is_error()) {
        spdlog::error("Could not remove finished item {} from the store: {}", item_id, removed.error().message);
    }

    history_.push_back(retired);
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
    return retired;
}

void SyncEngine::adopt_vector_locked(const EntityRef& entity, const VersionVector& vector) {
    auto merged = local_vector_locked(entity).merge(vector);
    auto saved = store_.save_vector(entity, merged);
    if (saved.is_error()) {
        spdlog::error("Could not persist vector of {}: {}", entity.to_string(), saved.error().message);
    }
    vectors_.insert_or_assign(entity, std::move(merged));
}

void SyncEngine::persist_locked(const SyncItem& item) {
    auto saved = store_.save_item(item);
    if (saved.is_error()) {
        spdlog::error("Could not persist item {}: {}", item.id(), saved.error().message);
    }
}

void SyncEngine::persist_counters_locked() {
    auto saved = store_.save_counters(store::QueueCounters{item_counter_, sequence_counter_});
    if (saved.is_error()) {
        spdlog::error("Could not persist queue counters: {}", saved.error().message);
    }
}

Timestamp SyncEngine::backoff_deadline(const SyncItem& item, Timestamp current) const {
    const double base = static_cast<double>(config_.base_backoff.count());
    const double cap = static_cast<double>(config_.max_backoff.count());
    const double delay = std::min(base * std::pow(config_.backoff_multiplier, item.retry_count()), cap);
    return current + std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

Result<SyncItem*> SyncEngine::find_item(const std::string& item_id) {
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return Fail<SyncItem*>(ErrorCode::NotFound, "Unknown item: " + item_id);
    }
    return Ok(&it->second);
}

Result<const SyncItem*> SyncEngine::find_item(const std::string& item_id) const {
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return Fail<const SyncItem*>(ErrorCode::NotFound, "Unknown item: " + item_id);
    }
    return Ok(&it->second);
}

// Rebuilds an open conflict from the remote side saved with the item
ConflictRecord SyncEngine::placeholder_record(const SyncItem& item) const {
    RemoteSnapshot remote;
    remote.entity = item.entity();
    auto relationship = VectorOrdering::Concurrent;
    if (const auto& saved = item.state().conflict_remote) {
        remote = *saved;
        relationship = item.operation().vector().compare(remote.vector);
    }
    return ConflictRecord{item.id(), item.operation(), std::move(remote), relationship,
                          now(), Resolution{ResolutionKind::ManualPending, {}, "manual"}};
}

void SyncEngine::publish(Outbox& out) {
    for (auto& deliver : out) {
        deliver();
    }
    out.clear();
}

} // namespace osync::sync
