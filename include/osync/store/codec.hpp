#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/item.hpp"
#include "osync/sync/operation.hpp"
#include "osync/sync/types.hpp"
#include "osync/sync/version_vector.hpp"

#include <nlohmann/json.hpp>

namespace osync::store {

using json = nlohmann::json;

json vector_to_json(const sync::VersionVector& vector);
Result<sync::VersionVector> vector_from_json(const json& j);

json entity_to_json(const sync::EntityRef& entity);
Result<sync::EntityRef> entity_from_json(const json& j);

json operation_to_json(const sync::SyncOperation& operation);
Result<sync::SyncOperation> operation_from_json(const json& j);

json snapshot_to_json(const sync::RemoteSnapshot& snapshot);
Result<sync::RemoteSnapshot> snapshot_from_json(const json& j);

json item_to_json(const sync::SyncItem& item);
Result<sync::SyncItem> item_from_json(const json& j);

// Nanoseconds since the Unix epoch
std::int64_t timestamp_to_int(sync::Timestamp timestamp);
sync::Timestamp timestamp_from_int(std::int64_t value);

} // namespace osync::store
