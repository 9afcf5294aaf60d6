#include "osync/sync/types.hpp"

#include <array>
#include <utility>

namespace osync::sync {
namespace {

template<typename Enum, std::size_t N>
Result<Enum> lookup(const std::array<std::pair<const char*, Enum>, N>& table,
                    const std::string& text,
                    const char* what) {
    for (const auto& [name, value] : table) {
        if (text == name) {
            return Ok(value);
        }
    }
    return Fail<Enum>(ErrorCode::InvalidPayload, std::string("Unknown ") + what + ": " + text);
}

const std::array<std::pair<const char*, OperationKind>, 3> kKinds {{
    {"create", OperationKind::Create},
    {"update", OperationKind::Update},
    {"delete", OperationKind::Delete},
}};

const std::array<std::pair<const char*, Priority>, 4> kPriorities {{
    {"low", Priority::Low},
    {"normal", Priority::Normal},
    {"high", Priority::High},
    {"critical", Priority::Critical},
}};

const std::array<std::pair<const char*, SyncStatus>, 8> kStatuses {{
    {"pending", SyncStatus::Pending},
    {"in_flight", SyncStatus::InFlight},
    {"synced", SyncStatus::Synced},
    {"failed", SyncStatus::Failed},
    {"conflicted", SyncStatus::Conflicted},
    {"manual_pending", SyncStatus::ManualPending},
    {"superseded", SyncStatus::Superseded},
    {"dismissed", SyncStatus::Dismissed},
}};

const std::array<std::pair<const char*, FailureKind>, 3> kFailures {{
    {"none", FailureKind::None},
    {"network", FailureKind::Network},
    {"rejected", FailureKind::Rejected},
}};

template<typename Enum, std::size_t N>
const char* name_of(const std::array<std::pair<const char*, Enum>, N>& table, Enum value) {
    for (const auto& [name, entry] : table) {
        if (entry == value) {
            return name;
        }
    }
    return "unknown";
}

} // namespace

const char* to_string(OperationKind kind) { return name_of(kKinds, kind); }
const char* to_string(Priority priority) { return name_of(kPriorities, priority); }
const char* to_string(SyncStatus status) { return name_of(kStatuses, status); }
const char* to_string(FailureKind kind) { return name_of(kFailures, kind); }

Result<OperationKind> operation_kind_from_string(const std::string& text) {
    return lookup(kKinds, text, "operation kind");
}

Result<Priority> priority_from_string(const std::string& text) {
    return lookup(kPriorities, text, "priority");
}

Result<SyncStatus> sync_status_from_string(const std::string& text) {
    return lookup(kStatuses, text, "sync status");
}

Result<FailureKind> failure_kind_from_string(const std::string& text) {
    return lookup(kFailures, text, "failure kind");
}

bool is_terminal(SyncStatus status) noexcept {
    return status == SyncStatus::Synced ||
           status == SyncStatus::Superseded ||
           status == SyncStatus::Dismissed;
}

} // namespace osync::sync
