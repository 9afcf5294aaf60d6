#include "osync/store/codec.hpp"

#include <chrono>

namespace osync::store {
namespace {

template<typename T>
Result<T> storage_error(const std::string& message) {
    return Fail<T>(ErrorCode::StorageFailure, message);
}

} // namespace

std::int64_t timestamp_to_int(sync::Timestamp timestamp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp.time_since_epoch()).count();
}

sync::Timestamp timestamp_from_int(std::int64_t value) {
    return sync::Timestamp(std::chrono::duration_cast<sync::Timestamp::duration>(std::chrono::nanoseconds(value)));
}

json vector_to_json(const sync::VersionVector& vector) {
    json j = json::object();
    for (const auto& [node, counter] : vector.entries()) {
        j[node] = counter;
    }
    return j;
}

Result<sync::VersionVector> vector_from_json(const json& j) {
    if (!j.is_object()) {
        return storage_error<sync::VersionVector>("Version vector must be an object");
    }
    sync::VersionVector::Counters counters;
    for (const auto& [node, counter] : j.items()) {
        if (!counter.is_number_unsigned()) {
            return storage_error<sync::VersionVector>("Counter for '" + node + "' must be unsigned");
        }
        counters[node] = counter.get<std::uint64_t>();
    }
    return Ok(sync::VersionVector(std::move(counters)));
}

json entity_to_json(const sync::EntityRef& entity) {
    return json{{"type", entity.type}, {"id", entity.id}};
}

Result<sync::EntityRef> entity_from_json(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j.contains("id") ||
        !j.at("type").is_string() || !j.at("id").is_string()) {
        return storage_error<sync::EntityRef>("Entity reference needs string type and id");
    }
    return Ok(sync::EntityRef{j.at("type").get<std::string>(), j.at("id").get<std::string>()});
}

json operation_to_json(const sync::SyncOperation& operation) {
    json j;
    j["entity"] = entity_to_json(operation.entity());
    j["kind"] = sync::to_string(operation.kind());
    j["payload"] = operation.payload();
    j["priority"] = sync::to_string(operation.priority());
    j["vector"] = vector_to_json(operation.vector());
    j["origin"] = operation.origin_node();
    j["created_at"] = timestamp_to_int(operation.created_at());
    return j;
}

Result<sync::SyncOperation> operation_from_json(const json& j) {
    if (!j.is_object()) {
        return storage_error<sync::SyncOperation>("Operation must be an object");
    }
    auto entity = entity_from_json(j.value("entity", json()));
    if (entity.is_error()) {
        return Err<sync::SyncOperation>(entity.error());
    }
    auto kind = sync::operation_kind_from_string(j.value("kind", ""));
    if (kind.is_error()) {
        return Err<sync::SyncOperation>(kind.error());
    }
    auto priority = sync::priority_from_string(j.value("priority", ""));
    if (priority.is_error()) {
        return Err<sync::SyncOperation>(priority.error());
    }
    auto vector = vector_from_json(j.value("vector", json::object()));
    if (vector.is_error()) {
        return Err<sync::SyncOperation>(vector.error());
    }
    return sync::SyncOperation::create(entity.value(),
                                       kind.value(),
                                       j.value("payload", json()),
                                       priority.value(),
                                       vector.value(),
                                       j.value("origin", ""),
                                       timestamp_from_int(j.value("created_at", std::int64_t{0})));
}

json snapshot_to_json(const sync::RemoteSnapshot& snapshot) {
    json j;
    j["entity"] = entity_to_json(snapshot.entity);
    j["data"] = snapshot.data;
    j["vector"] = vector_to_json(snapshot.vector);
    j["modified_at"] = timestamp_to_int(snapshot.modified_at);
    j["modified_by"] = snapshot.modified_by;
    j["deleted"] = snapshot.deleted;
    return j;
}

Result<sync::RemoteSnapshot> snapshot_from_json(const json& j) {
    if (!j.is_object()) {
        return storage_error<sync::RemoteSnapshot>("Remote snapshot must be an object");
    }
    auto entity = entity_from_json(j.value("entity", json()));
    if (entity.is_error()) {
        return Err<sync::RemoteSnapshot>(entity.error());
    }
    auto vector = vector_from_json(j.value("vector", json::object()));
    if (vector.is_error()) {
        return Err<sync::RemoteSnapshot>(vector.error());
    }

    sync::RemoteSnapshot snapshot;
    snapshot.entity = entity.value();
    snapshot.data = j.value("data", json());
    snapshot.vector = vector.value();
    snapshot.modified_at = timestamp_from_int(j.value("modified_at", std::int64_t{0}));
    snapshot.modified_by = j.value("modified_by", "");
    snapshot.deleted = j.value("deleted", false);
    return Ok(std::move(snapshot));
}

json item_to_json(const sync::SyncItem& item) {
    const auto& state = item.state();
    json j;
    j["id"] = item.id();
    j["sequence"] = item.sequence();
    j["operation"] = operation_to_json(item.operation());
    j["status"] = sync::to_string(state.status);
    j["retry_count"] = state.retry_count;
    j["failure"] = sync::to_string(state.failure);
    j["last_error"] = state.last_error;
    j["next_attempt_at"] = timestamp_to_int(state.next_attempt_at);
    j["exhausted"] = state.exhausted;
    j["parent_id"] = state.parent_id ? json(*state.parent_id) : json();
    j["conflict_remote"] = state.conflict_remote ? snapshot_to_json(*state.conflict_remote) : json();
    j["updated_at"] = timestamp_to_int(state.updated_at);
    return j;
}

Result<sync::SyncItem> item_from_json(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j.at("id").is_string()) {
        return storage_error<sync::SyncItem>("Item needs a string id");
    }
    auto operation = operation_from_json(j.value("operation", json()));
    if (operation.is_error()) {
        return Err<sync::SyncItem>(operation.error());
    }
    auto status = sync::sync_status_from_string(j.value("status", ""));
    if (status.is_error()) {
        return Err<sync::SyncItem>(status.error());
    }
    auto failure = sync::failure_kind_from_string(j.value("failure", "none"));
    if (failure.is_error()) {
        return Err<sync::SyncItem>(failure.error());
    }

    sync::SyncItemState state;
    state.status = status.value();
    state.retry_count = j.value("retry_count", 0u);
    state.failure = failure.value();
    state.last_error = j.value("last_error", "");
    state.next_attempt_at = timestamp_from_int(j.value("next_attempt_at", std::int64_t{0}));
    state.exhausted = j.value("exhausted", false);
    if (j.contains("parent_id") && j.at("parent_id").is_string()) {
        state.parent_id = j.at("parent_id").get<std::string>();
    }
    if (j.contains("conflict_remote") && !j.at("conflict_remote").is_null()) {
        auto remote = snapshot_from_json(j.at("conflict_remote"));
        if (remote.is_error()) {
            return Err<sync::SyncItem>(remote.error());
        }
        state.conflict_remote = std::move(remote.value());
    }
    state.updated_at = timestamp_from_int(j.value("updated_at", std::int64_t{0}));

    return Ok(sync::SyncItem(j.at("id").get<std::string>(),
                             j.value("sequence", std::uint64_t{0}),
                             operation.value(),
                             std::move(state)));
}

} // namespace osync::store
