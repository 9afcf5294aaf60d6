#pragma once

#include "osync/sync/version_vector.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace osync::sync {

using Timestamp = std::chrono::system_clock::time_point;
using Payload = nlohmann::json;

/**
 * @brief Identifies one synchronised entity, e.g. ("forum_post", "1432")
 */
struct EntityRef {
    std::string type;
    std::string id;

    [[nodiscard]] std::string to_string() const { return type + "/" + id; }

    bool operator==(const EntityRef& other) const { return type == other.type && id == other.id; }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
    bool operator<(const EntityRef& other) const {
        return type == other.type ? id < other.id : type < other.type;
    }
};

struct EntityRefHash {
    std::size_t operator()(const EntityRef& ref) const noexcept {
        const auto h1 = std::hash<std::string>{}(ref.type);
        const auto h2 = std::hash<std::string>{}(ref.id);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

enum class OperationKind {
    Create,
    Update,
    Delete
};

/**
 * @brief Queue priority, compared numerically (Critical services first)
 */
enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

/**
 * @brief Lifecycle of a queued item
 *
 * Pending → InFlight → {Synced, Failed, Conflicted, Superseded}
 * Failed → {Pending, Dismissed}
 * Conflicted → {Synced, ManualPending}
 * ManualPending → {Synced, Dismissed}
 * Pending → Dismissed (cancel)
 *
 * Synced, Superseded and Dismissed are terminal.
 */
enum class SyncStatus {
    Pending,
    InFlight,
    Synced,
    Failed,
    Conflicted,
    ManualPending,
    Superseded,
    Dismissed
};

/**
 * @brief Why a Failed item failed
 *
 * Network failures are retried automatically after backoff,
 * rejections wait for the user.
 */
enum class FailureKind {
    None,
    Network,
    Rejected
};

/**
 * @brief Remote state of an entity as returned by the service layer
 */
struct RemoteSnapshot {
    EntityRef entity;
    Payload data;
    VersionVector vector;
    Timestamp modified_at{};
    std::string modified_by;   ///< Node that produced this version
    bool deleted = false;      ///< Tombstone
};

const char* to_string(OperationKind kind);
const char* to_string(Priority priority);
const char* to_string(SyncStatus status);
const char* to_string(FailureKind kind);

Result<OperationKind> operation_kind_from_string(const std::string& text);
Result<Priority> priority_from_string(const std::string& text);
Result<SyncStatus> sync_status_from_string(const std::string& text);
Result<FailureKind> failure_kind_from_string(const std::string& text);

[[nodiscard]] bool is_terminal(SyncStatus status) noexcept;

} // namespace osync::sync
