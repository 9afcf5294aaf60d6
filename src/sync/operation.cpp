#include "osync/sync/operation.hpp"

#include <algorithm>

namespace osync::sync {

bool is_empty_payload(const Payload& payload) {
    if (payload.is_null()) {
        return true;
    }
    if (payload.is_string()) {
        return payload.get_ref<const std::string&>().empty();
    }
    if (payload.is_object() || payload.is_array()) {
        return payload.empty();
    }
    return false;
}

SyncOperation::SyncOperation(EntityRef entity,
                             OperationKind kind,
                             Payload payload,
                             Priority priority,
                             VersionVector vector,
                             std::string origin_node,
                             Timestamp created_at)
    : entity_(std::move(entity)),
      kind_(kind),
      payload_(std::move(payload)),
      priority_(priority),
      vector_(std::move(vector)),
      origin_node_(std::move(origin_node)),
      created_at_(created_at) {}

Result<SyncOperation> SyncOperation::create(EntityRef entity,
                                            OperationKind kind,
                                            Payload payload,
                                            Priority priority,
                                            VersionVector vector,
                                            std::string origin_node,
                                            Timestamp created_at) {
    if (entity.type.empty() || entity.id.empty()) {
        return Fail<SyncOperation>(ErrorCode::InvalidPayload,
                                   "Entity reference needs both type and id");
    }
    if (kind != OperationKind::Delete && is_empty_payload(payload)) {
        return Fail<SyncOperation>(ErrorCode::InvalidPayload,
                                   std::string("Empty payload for ") + to_string(kind) +
                                   " of " + entity.to_string());
    }
    return Ok(SyncOperation(std::move(entity), kind, std::move(payload), priority,
                            std::move(vector), std::move(origin_node), created_at));
}

SyncOperation SyncOperation::coalesce(const SyncOperation& newer) const {
    SyncOperation result = *this;
    result.priority_ = std::max(priority_, newer.priority_);
    result.created_at_ = std::min(created_at_, newer.created_at_);
    result.vector_ = vector_.merge(newer.vector_);

    if (kind_ == OperationKind::Delete) {
        return result;
    }

    result.payload_ = newer.payload_;
    result.origin_node_ = newer.origin_node_;
    if (newer.kind_ == OperationKind::Delete) {
        result.kind_ = OperationKind::Delete;
    } else if (kind_ != OperationKind::Create) {
        result.kind_ = newer.kind_;
    }
    return result;
}

SyncOperation SyncOperation::rebased(OperationKind kind,
                                     Payload payload,
                                     VersionVector vector,
                                     Priority priority,
                                     Timestamp created_at) const {
    SyncOperation result = *this;
    result.kind_ = kind;
    result.payload_ = std::move(payload);
    result.vector_ = std::move(vector);
    result.priority_ = priority;
    result.created_at_ = created_at;
    return result;
}

} // namespace osync::sync
