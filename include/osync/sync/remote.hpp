#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/operation.hpp"
#include "osync/sync/types.hpp"

#include <optional>

namespace osync::sync {

/**
 * @brief Boundary to the forum / LMS service clients
 *
 * Implementations wrap the real HTTP clients. Both calls receive the
 * deadline the engine will enforce; a call that returns after it is
 * counted as a NetworkFailure whatever its result.
 *
 * Expected error codes:
 * - fetch_remote: NetworkFailure
 * - apply_remote: NetworkFailure, Rejected (message carries the reason),
 *                 Concurrent (remote saw a newer version at write time)
 */
class RemoteService {
public:
    virtual ~RemoteService() = default;

    /**
     * @return The current snapshot, or nullopt when the entity does not
     *         exist remotely yet
     */
    virtual Result<std::optional<RemoteSnapshot>> fetch_remote(const EntityRef& entity,
                                                               Timestamp deadline) = 0;

    /**
     * @return The entity's version vector after the write
     */
    virtual Result<VersionVector> apply_remote(const SyncOperation& operation,
                                               Timestamp deadline) = 0;
};

} // namespace osync::sync
