#include "osync/sync/conflict.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace osync::sync {
namespace {

bool local_wins_by_time(const SyncOperation& local, const RemoteSnapshot& remote) {
    if (local.created_at() == remote.modified_at) {
        return local.origin_node() > remote.modified_by;
    }
    return local.created_at() > remote.modified_at;
}

bool field_differs(const Payload& lhs, const Payload& rhs, const std::string& key) {
    const bool lhs_has = lhs.is_object() && lhs.contains(key);
    const bool rhs_has = rhs.is_object() && rhs.contains(key);
    if (lhs_has != rhs_has) {
        return true;
    }
    return lhs_has && lhs.at(key) != rhs.at(key);
}

// Overlay the locally changed fields onto the remote entity. Returns nullopt
// when a changed field is not mergeable or both sides changed it differently.
std::optional<Payload> merge_fields(const Payload& local,
                                    const RemoteSnapshot& remote,
                                    const std::optional<Payload>& base,
                                    const std::set<std::string>& mergeable,
                                    std::size_t& applied) {
    applied = 0;
    if (!local.is_object() || !(remote.data.is_object() || remote.data.is_null())) {
        return std::nullopt;
    }

    const bool base_known = base.has_value() && base->is_object();
    Payload merged = remote.data.is_null() ? Payload::object() : remote.data;

    for (const auto& [key, value] : local.items()) {
        const bool local_changed = !base_known || field_differs(*base, local, key);
        if (!local_changed) {
            continue;
        }
        if (mergeable.count(key) == 0) {
            spdlog::debug("Field '{}' of {} is not mergeable", key, remote.entity.to_string());
            return std::nullopt;
        }
        if (merged.contains(key) && merged.at(key) == value) {
            continue;
        }
        if (base_known && field_differs(*base, remote.data, key)) {
            spdlog::debug("Field '{}' of {} changed on both sides", key, remote.entity.to_string());
            return std::nullopt;
        }
        merged[key] = value;
        ++applied;
    }
    return merged;
}

} // namespace

const char* to_string(ConflictMode mode) {
    switch (mode) {
        case ConflictMode::FieldMerge: return "field_merge";
        case ConflictMode::LastWriterWins: return "last_writer_wins";
        case ConflictMode::Manual: return "manual";
    }
    return "unknown";
}

const char* to_string(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::LocalWins: return "local_wins";
        case ResolutionKind::RemoteWins: return "remote_wins";
        case ResolutionKind::Merged: return "merged";
        case ResolutionKind::ManualPending: return "manual_pending";
    }
    return "unknown";
}

Result<ConflictMode> conflict_mode_from_string(const std::string& text) {
    if (text == "field_merge") return Ok(ConflictMode::FieldMerge);
    if (text == "last_writer_wins") return Ok(ConflictMode::LastWriterWins);
    if (text == "manual") return Ok(ConflictMode::Manual);
    return Fail<ConflictMode>(ErrorCode::InvalidConfig, "Unknown conflict mode: " + text);
}

void ConflictResolver::register_policy(const std::string& entity_type, EntityPolicy policy) {
    std::unique_lock lock(mutex_);
    policies_[entity_type] = std::move(policy);
}

EntityPolicy ConflictResolver::policy_for(const std::string& entity_type) const {
    std::shared_lock lock(mutex_);
    const auto it = policies_.find(entity_type);
    return it == policies_.end() ? EntityPolicy{} : it->second;
}

Result<ResolutionOutcome> ConflictResolver::resolve(const std::string& item_id,
                                                    const SyncOperation& local,
                                                    const RemoteSnapshot& remote,
                                                    const std::optional<Payload>& base,
                                                    Timestamp now) const {
    const auto relationship = local.vector().compare(remote.vector);
    if (relationship != VectorOrdering::Concurrent) {
        return Fail<ResolutionOutcome>(ErrorCode::InvalidPayload,
                                       std::string("Versions are not concurrent (") +
                                       to_string(relationship) + ") for " + item_id);
    }

    ConflictRecord record{item_id, local, remote, relationship, now, std::nullopt};
    auto merged_vector = local.vector().merge(remote.vector);
    const auto policy = policy_for(local.entity().type);

    if (policy.mode == ConflictMode::Manual) {
        return Ok(escalate(std::move(record), std::move(merged_vector)));
    }

    ResolutionOutcome outcome{record, std::nullopt, merged_vector};

    // Delete wins, whichever side issued it
    if (local.kind() == OperationKind::Delete) {
        outcome.record.resolution = Resolution{ResolutionKind::LocalWins, {}, "delete-wins"};
        outcome.follow_up = local.rebased(OperationKind::Delete, local.payload(), merged_vector,
                                          Priority::Critical, now);
        return Ok(std::move(outcome));
    }
    if (remote.deleted) {
        outcome.record.resolution = Resolution{ResolutionKind::RemoteWins, {}, "delete-wins"};
        return Ok(std::move(outcome));
    }

    if (policy.mode == ConflictMode::FieldMerge) {
        std::size_t applied = 0;
        auto merged = merge_fields(local.payload(), remote, base, policy.mergeable_fields, applied);
        if (!merged) {
            return Ok(escalate(std::move(record), std::move(merged_vector)));
        }
        if (applied == 0) {
            outcome.record.resolution = Resolution{ResolutionKind::RemoteWins, {}, "field-merge"};
            return Ok(std::move(outcome));
        }
        outcome.record.resolution = Resolution{ResolutionKind::Merged, *merged, "field-merge"};
        outcome.follow_up = local.rebased(OperationKind::Update, *merged, merged_vector,
                                          Priority::Critical, now);
        return Ok(std::move(outcome));
    }

    if (local_wins_by_time(local, remote)) {
        outcome.record.resolution = Resolution{ResolutionKind::LocalWins, {}, "last-writer-wins"};
        outcome.follow_up = local.rebased(local.kind(), local.payload(), merged_vector,
                                          Priority::Critical, now);
    } else {
        outcome.record.resolution = Resolution{ResolutionKind::RemoteWins, {}, "last-writer-wins"};
    }
    return Ok(std::move(outcome));
}

ResolutionOutcome ConflictResolver::escalate(ConflictRecord record, VersionVector merged) const {
    record.resolution = Resolution{ResolutionKind::ManualPending, {}, "manual"};
    return ResolutionOutcome{std::move(record), std::nullopt, std::move(merged)};
}

void ConflictResolver::open(ConflictRecord record) {
    std::unique_lock lock(mutex_);
    auto id = record.item_id;
    pending_.insert_or_assign(std::move(id), std::move(record));
}

Result<ConflictRecord> ConflictResolver::take_pending(const std::string& item_id) {
    std::unique_lock lock(mutex_);
    auto it = pending_.find(item_id);
    if (it == pending_.end()) {
        return Fail<ConflictRecord>(ErrorCode::NotFound, "No open conflict for " + item_id);
    }
    auto record = std::move(it->second);
    pending_.erase(it);
    return Ok(std::move(record));
}

std::vector<ConflictRecord> ConflictResolver::list_pending() const {
    std::shared_lock lock(mutex_);
    std::vector<ConflictRecord> result;
    result.reserve(pending_.size());
    for (const auto& [id, record] : pending_) {
        result.push_back(record);
    }
    return result;
}

std::optional<ConflictRecord> ConflictResolver::find_pending(const std::string& item_id) const {
    std::shared_lock lock(mutex_);
    const auto it = pending_.find(item_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ConflictResolver::pending_count() const {
    std::shared_lock lock(mutex_);
    return pending_.size();
}

} // namespace osync::sync
