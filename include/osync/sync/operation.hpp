#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/types.hpp"
#include "osync/sync/version_vector.hpp"

#include <string>

namespace osync::sync {

/**
 * @brief One queued local change
 *
 * Immutable once created. The payload is either a field diff or a full
 * snapshot of the entity; the engine never interprets it except during
 * field-level conflict merging.
 */
class SyncOperation {
public:
    /**
     * @brief Validate and build an operation
     *
     * Fails with InvalidPayload when the entity reference is incomplete or
     * when a Create/Update carries an empty payload. Deletes may be empty.
     */
    static Result<SyncOperation> create(EntityRef entity,
                                        OperationKind kind,
                                        Payload payload,
                                        Priority priority,
                                        VersionVector vector,
                                        std::string origin_node,
                                        Timestamp created_at = std::chrono::system_clock::now());

    [[nodiscard]] const EntityRef& entity() const noexcept { return entity_; }
    [[nodiscard]] OperationKind kind() const noexcept { return kind_; }
    [[nodiscard]] const Payload& payload() const noexcept { return payload_; }
    [[nodiscard]] Priority priority() const noexcept { return priority_; }
    [[nodiscard]] const VersionVector& vector() const noexcept { return vector_; }
    [[nodiscard]] const std::string& origin_node() const noexcept { return origin_node_; }
    [[nodiscard]] Timestamp created_at() const noexcept { return created_at_; }

    /**
     * @brief Fold a newer operation on the same entity into this one
     *
     * Keeps the earliest creation time and the higher priority, takes the
     * newer payload and merges both vectors. A pending Delete absorbs any
     * later edit; a newer Delete turns the result into a Delete; a pending
     * Create stays a Create.
     */
    [[nodiscard]] SyncOperation coalesce(const SyncOperation& newer) const;

    /**
     * @brief Copy re-targeted at a new payload, vector and priority
     *
     * Used to synthesise conflict follow-ups.
     */
    [[nodiscard]] SyncOperation rebased(OperationKind kind,
                                        Payload payload,
                                        VersionVector vector,
                                        Priority priority,
                                        Timestamp created_at) const;

private:
    SyncOperation(EntityRef entity,
                  OperationKind kind,
                  Payload payload,
                  Priority priority,
                  VersionVector vector,
                  std::string origin_node,
                  Timestamp created_at);

    EntityRef entity_;
    OperationKind kind_;
    Payload payload_;
    Priority priority_;
    VersionVector vector_;
    std::string origin_node_;
    Timestamp created_at_;
};

/**
 * @brief True for null, {}, [] and ""
 */
[[nodiscard]] bool is_empty_payload(const Payload& payload);

} // namespace osync::sync
