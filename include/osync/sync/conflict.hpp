#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/operation.hpp"
#include "osync/sync/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace osync::sync {

enum class ConflictMode {
    FieldMerge,      // Disjoint field edits are combined
    LastWriterWins,  // Wall-clock timestamp, node id tie-break
    Manual           // Never auto-resolved
};

/**
 * @brief Conflict handling capabilities of one entity type
 */
struct EntityPolicy {
    ConflictMode mode = ConflictMode::LastWriterWins;
    std::set<std::string> mergeable_fields;
};

enum class ResolutionKind {
    LocalWins,
    RemoteWins,
    Merged,
    ManualPending
};

struct Resolution {
    ResolutionKind kind = ResolutionKind::ManualPending;
    Payload merged_payload;  ///< Only set for Merged
    std::string rule;        ///< "manual", "delete-wins", "field-merge", "last-writer-wins"
};

struct ConflictRecord {
    std::string item_id;
    SyncOperation local;
    RemoteSnapshot remote;
    VectorOrdering relationship = VectorOrdering::Concurrent;
    Timestamp detected_at{};
    std::optional<Resolution> resolution;
};

struct ResolutionOutcome {
    ConflictRecord record;
    std::optional<SyncOperation> follow_up;  ///< Set for LocalWins and Merged
    VersionVector merged_vector;
};

const char* to_string(ConflictMode mode);
const char* to_string(ResolutionKind kind);
Result<ConflictMode> conflict_mode_from_string(const std::string& text);

class ConflictResolver {
public:
    void register_policy(const std::string& entity_type, EntityPolicy policy);
    [[nodiscard]] EntityPolicy policy_for(const std::string& entity_type) const;

    /**
     * @brief Resolve a concurrent local operation against a remote snapshot
     *
     * Policy order: Manual types are escalated untouched, then delete wins,
     * then field merge (FieldMerge types) or last-writer-wins. Escalations
     * come back as ManualPending; the caller decides when to open() them.
     *
     * @param base Last remote snapshot observed before the local edit, if known
     */
    Result<ResolutionOutcome> resolve(const std::string& item_id,
                                      const SyncOperation& local,
                                      const RemoteSnapshot& remote,
                                      const std::optional<Payload>& base,
                                      Timestamp now) const;

    void open(ConflictRecord record);
    Result<ConflictRecord> take_pending(const std::string& item_id);

    [[nodiscard]] std::vector<ConflictRecord> list_pending() const;
    [[nodiscard]] std::optional<ConflictRecord> find_pending(const std::string& item_id) const;
    [[nodiscard]] std::size_t pending_count() const;

private:
    ResolutionOutcome escalate(ConflictRecord record, VersionVector merged) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, EntityPolicy> policies_;
    std::map<std::string, ConflictRecord> pending_;
};

} // namespace osync::sync
