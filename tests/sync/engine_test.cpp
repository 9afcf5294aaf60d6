#include "osync/sync/engine.hpp"
#include "osync/events/components.hpp"
#include "osync/store/memory_store.hpp"

#include "fake_remote.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <optional>
#include <thread>
#include <vector>

using osync::ErrorCode;
using osync::EngineConfig;
using osync::SupersededPolicy;
using osync::events::EventBus;
using osync::store::MemorySyncStore;
using osync::sync::ConflictMode;
using osync::sync::EntityPolicy;
using osync::sync::EntityRef;
using osync::sync::ManualDecision;
using osync::sync::OperationKind;
using osync::sync::Payload;
using osync::sync::Priority;
using osync::sync::RemoteSnapshot;
using osync::sync::SyncEngine;
using osync::sync::SyncOperation;
using osync::sync::SyncStatus;
using osync::sync::VersionVector;
using osync::testing::FakeRemote;
using osync::testing::ManualClock;
using osync::testing::make_config;
using namespace std::chrono_literals;

namespace {

const EntityRef kPost{"post", "1"};

VersionVector vv(std::map<std::string, std::uint64_t> counters) {
    return VersionVector(std::move(counters));
}

RemoteSnapshot snapshot(const EntityRef& entity, Payload data, VersionVector vector,
                        osync::sync::Timestamp modified_at, std::string modified_by = "B") {
    RemoteSnapshot result;
    result.entity = entity;
    result.data = std::move(data);
    result.vector = std::move(vector);
    result.modified_at = modified_at;
    result.modified_by = std::move(modified_by);
    return result;
}

class SyncEngineTest : public ::testing::Test {
protected:
    SyncEngineTest() : remote(&clock) {}

    std::unique_ptr<SyncEngine> make_engine(EngineConfig config, osync::sync::LocalStateProvider provider = {}) {
        return std::make_unique<SyncEngine>(std::move(config), remote, store, bus, std::move(provider));
    }

    std::unique_ptr<SyncEngine> make_engine() {
        return make_engine(make_config(clock));
    }

    ManualClock clock;
    FakeRemote remote;
    MemorySyncStore store;
    EventBus bus;
};

} // namespace

// ════════════════════════════════════════════════════════
// Enqueue and coalescing
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, EnqueueBumpsLocalVector) {
    auto engine = make_engine();

    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "hello"}});
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(id.value(), "item-1");

    auto item = engine->item(id.value());
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().status(), SyncStatus::Pending);
    EXPECT_EQ(item.value().operation().vector(), vv({{"A", 1}}));
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 1}}));
    EXPECT_EQ(engine->pending_count(), 1u);
    EXPECT_TRUE(store.contains("item-1"));
}

TEST_F(SyncEngineTest, RejectsEmptyPayload) {
    auto engine = make_engine();

    auto id = engine->enqueue(kPost, OperationKind::Update, Payload::object());
    ASSERT_TRUE(id.is_error());
    EXPECT_EQ(id.error().code, ErrorCode::InvalidPayload);
    EXPECT_EQ(engine->pending_count(), 0u);
    EXPECT_TRUE(engine->local_vector(kPost).empty());
}

TEST_F(SyncEngineTest, CoalescesPendingUpdates) {
    auto engine = make_engine();
    int coalesced = 0;
    bus.subscribe<osync::events::OperationCoalescedEvent>([&](const auto&) { ++coalesced; });

    const auto first_time = clock.now();
    auto first = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "one"}});
    clock.advance(5s);
    auto second = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "two"}}, Priority::High);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(coalesced, 1);

    auto items = engine->items();
    ASSERT_EQ(items.size(), 1u);
    const auto& operation = items.front().operation();
    EXPECT_EQ(operation.payload()["title"], "two");
    EXPECT_EQ(operation.created_at(), first_time);
    EXPECT_EQ(operation.priority(), Priority::High);
    EXPECT_EQ(operation.vector(), vv({{"A", 2}}));
}

TEST_F(SyncEngineTest, PendingDeleteAbsorbsLaterEdits) {
    auto engine = make_engine();

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Delete, Payload()).is_ok());
    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "zombie"}}).is_ok());

    auto items = engine->items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items.front().operation().kind(), OperationKind::Delete);
}

TEST_F(SyncEngineTest, CreateFollowedByUpdateStaysCreate) {
    auto engine = make_engine();

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "draft"}}).is_ok());
    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "final"}}).is_ok());

    auto items = engine->items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items.front().operation().kind(), OperationKind::Create);
    EXPECT_EQ(items.front().operation().payload()["title"], "final");
}

// ════════════════════════════════════════════════════════
// Reconciliation
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, AppliesWhenRemoteDoesNotExist) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "hello"}});
    ASSERT_TRUE(id.is_ok());

    auto report = engine->run_cycle();
    EXPECT_FALSE(report.is_idle());
    EXPECT_EQ(report.item_id, id.value());
    EXPECT_EQ(report.outcome, SyncStatus::Synced);

    auto stored = remote.remote(kPost);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->data["title"], "hello");
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 1}}));

    // Finished items leave the live queue and the store
    EXPECT_TRUE(engine->items().empty());
    EXPECT_FALSE(store.contains(id.value()));
    auto finished = engine->item(id.value());
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(finished.value().status(), SyncStatus::Synced);

    EXPECT_TRUE(engine->run_cycle().is_idle());
}

TEST_F(SyncEngineTest, StaleOperationIsSuperseded) {
    auto engine = make_engine();
    int adopted = 0;
    bus.subscribe<osync::events::RemoteAdoptedEvent>([&](const auto&) { ++adopted; });

    remote.set_remote(snapshot(kPost, Payload{{"title", "server"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));
    auto id = engine->enqueue(SyncOperation::create(kPost, OperationKind::Update, Payload{{"title", "old"}},
                                                    Priority::Normal, vv({{"A", 1}}), "A", clock.now()).value());
    ASSERT_TRUE(id.is_ok());

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Superseded);
    EXPECT_EQ(remote.apply_attempts(), 0u);
    EXPECT_EQ(adopted, 1);
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 1}, {"B", 1}}));
}

TEST_F(SyncEngineTest, LastWriterWinsKeepsNewerLocalEdit) {
    auto engine = make_engine();

    remote.set_remote(snapshot(kPost, Payload{{"title", "server"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));
    clock.advance(10s);
    auto id = engine->enqueue(SyncOperation::create(kPost, OperationKind::Update, Payload{{"title", "mine"}},
                                                    Priority::Normal, vv({{"A", 2}}), "A", clock.now()).value());
    ASSERT_TRUE(id.is_ok());

    auto first = engine->run_cycle();
    EXPECT_EQ(first.outcome, SyncStatus::Conflicted);

    auto items = engine->items();
    ASSERT_EQ(items.size(), 2u);
    const auto& follow_up = items.back();
    EXPECT_TRUE(follow_up.is_follow_up());
    EXPECT_EQ(follow_up.operation().priority(), Priority::Critical);
    EXPECT_EQ(follow_up.operation().vector(), vv({{"A", 2}, {"B", 1}}));

    auto rest = engine->drain();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest.front().item_id, follow_up.id());

    auto parent = engine->item(id.value());
    ASSERT_TRUE(parent.is_ok());
    EXPECT_EQ(parent.value().status(), SyncStatus::Synced);
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 2}, {"B", 1}}));
    EXPECT_EQ(remote.remote(kPost)->data["title"], "mine");
    EXPECT_TRUE(engine->items().empty());
}

TEST_F(SyncEngineTest, LastWriterWinsAdoptsNewerRemoteEdit) {
    auto engine = make_engine();
    int adopted = 0;
    bus.subscribe<osync::events::RemoteAdoptedEvent>([&](const auto&) { ++adopted; });

    auto id = engine->enqueue(SyncOperation::create(kPost, OperationKind::Update, Payload{{"title", "mine"}},
                                                    Priority::Normal, vv({{"A", 2}}), "A", clock.now()).value());
    clock.advance(10s);
    remote.set_remote(snapshot(kPost, Payload{{"title", "server"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Synced);
    EXPECT_EQ(remote.apply_attempts(), 0u);
    EXPECT_EQ(adopted, 1);
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 2}, {"B", 1}}));
    EXPECT_TRUE(engine->items().empty());
}

TEST_F(SyncEngineTest, EqualVectorsSyncWithoutWriting) {
    auto engine = make_engine();

    remote.set_remote(snapshot(kPost, Payload{{"title", "same"}}, vv({{"A", 1}}), clock.now(), "A"));
    auto id = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "same"}});
    ASSERT_TRUE(id.is_ok());

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Synced);
    EXPECT_EQ(remote.apply_attempts(), 0u);
}

TEST_F(SyncEngineTest, HigherPriorityEntityIsServicedFirst) {
    auto engine = make_engine();
    const EntityRef low{"post", "low"};
    const EntityRef urgent{"grade", "urgent"};
    const EntityRef normal{"post", "normal"};

    ASSERT_TRUE(engine->enqueue(low, OperationKind::Create, Payload{{"v", 1}}, Priority::Low).is_ok());
    clock.advance(1s);
    ASSERT_TRUE(engine->enqueue(urgent, OperationKind::Create, Payload{{"v", 2}}, Priority::Critical).is_ok());
    clock.advance(1s);
    ASSERT_TRUE(engine->enqueue(normal, OperationKind::Create, Payload{{"v", 3}}).is_ok());

    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].entity, urgent);
    EXPECT_EQ(reports[1].entity, normal);
    EXPECT_EQ(reports[2].entity, low);
}

TEST_F(SyncEngineTest, LaterEditWaitsBehindFailedEarlierOne) {
    auto engine = make_engine();

    auto first = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "one"}});
    remote.fail_next_apply(ErrorCode::NetworkFailure);
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);

    // Not coalesced into the Failed item, queued behind it instead
    auto second = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "two"}});
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());
    EXPECT_TRUE(engine->run_cycle().is_idle());

    clock.advance(1s);
    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].item_id, first.value());
    EXPECT_EQ(reports[1].item_id, second.value());

    auto applied = remote.applied();
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[0].payload()["title"], "one");
    EXPECT_EQ(applied[1].payload()["title"], "two");
}

// ════════════════════════════════════════════════════════
// Failures and retries
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, NetworkFailureBacksOffExponentially) {
    auto engine = make_engine();
    std::vector<osync::events::RetryScheduledEvent> retries;
    bus.subscribe<osync::events::RetryScheduledEvent>([&](const auto& e) { retries.push_back(e); });

    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "hello"}});
    const auto t0 = clock.now();

    remote.fail_next_apply(ErrorCode::NetworkFailure);
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
    ASSERT_EQ(retries.size(), 1u);
    EXPECT_EQ(retries[0].next_attempt_at, t0 + 1s);
    EXPECT_EQ(engine->next_wakeup(), t0 + 1s);

    // Backoff not elapsed yet
    EXPECT_TRUE(engine->run_cycle().is_idle());

    clock.advance(1s);
    remote.fail_next_apply(ErrorCode::NetworkFailure);
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
    ASSERT_EQ(retries.size(), 2u);
    EXPECT_EQ(retries[1].retry_count, 1u);
    EXPECT_EQ(retries[1].next_attempt_at, t0 + 1s + 2s);

    clock.advance(2s);
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Synced);

    auto item = engine->item(id.value());
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().retry_count(), 2u);
}

TEST_F(SyncEngineTest, BackoffIsCappedAtMaximum) {
    auto config = make_config(clock);
    config.max_backoff = 3s;
    config.max_retries = 10;
    auto engine = make_engine(config);
    std::vector<osync::events::RetryScheduledEvent> retries;
    bus.subscribe<osync::events::RetryScheduledEvent>([&](const auto& e) { retries.push_back(e); });

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}}).is_ok());
    remote.fail_every_apply(ErrorCode::NetworkFailure);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
        clock.advance(10s);
    }
    ASSERT_EQ(retries.size(), 4u);
    EXPECT_EQ(retries[3].next_attempt_at - retries[3].timestamp, 3s);
}

TEST_F(SyncEngineTest, RetryBoundMakesFailureTerminal) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "hello"}});
    ASSERT_TRUE(id.is_ok());
    remote.fail_every_apply(ErrorCode::NetworkFailure);

    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(engine->retry(id.value()).is_ok());
        EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
    }

    auto exhausted = engine->retry(id.value());
    ASSERT_TRUE(exhausted.is_error());
    EXPECT_EQ(exhausted.error().code, ErrorCode::RetryExhausted);

    auto item = engine->item(id.value());
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().status(), SyncStatus::Failed);
    EXPECT_EQ(item.value().retry_count(), 5u);
    EXPECT_TRUE(item.value().state().exhausted);

    // No automatic retry either, however long we wait
    clock.advance(1h);
    EXPECT_TRUE(engine->run_cycle().is_idle());
    EXPECT_EQ(remote.apply_attempts(), 6u);
}

TEST_F(SyncEngineTest, RejectedItemIsNotRetriedAndBlocksEntity) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "spam"}});
    remote.fail_next_apply(ErrorCode::Rejected, "moderation");

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Failed);
    EXPECT_EQ(report.detail, "moderation");

    auto later = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "ham"}});
    clock.advance(1h);
    EXPECT_TRUE(engine->run_cycle().is_idle());
    EXPECT_FALSE(engine->next_wakeup().has_value() && *engine->next_wakeup() > clock.now());

    ASSERT_TRUE(engine->dismiss(id.value()).is_ok());
    EXPECT_EQ(engine->run_cycle().item_id, later.value());
}

TEST_F(SyncEngineTest, LateAnswerCountsAsNetworkFailure) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "slow"}});
    remote.set_latency(11s);

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Failed);
    EXPECT_NE(report.detail.find("deadline"), std::string::npos);

    // The write did land; the retry notices and does not write again
    remote.set_latency(0ms);
    ASSERT_TRUE(engine->retry(id.value()).is_ok());
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Synced);
    EXPECT_EQ(remote.apply_count(), 1u);
}

TEST_F(SyncEngineTest, FetchFailureIsRetried) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}}).is_ok());
    remote.fail_next_fetch(ErrorCode::NetworkFailure);

    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Failed);
    clock.advance(1s);
    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::Synced);
}

// ════════════════════════════════════════════════════════
// User actions
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, CancelDismissesPendingItem) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}});

    ASSERT_TRUE(engine->cancel(id.value()).is_ok());
    EXPECT_EQ(engine->pending_count(), 0u);
    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::Dismissed);
    EXPECT_TRUE(engine->run_cycle().is_idle());

    auto again = engine->cancel(id.value());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(SyncEngineTest, CancelRejectsFailedItems) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}});
    remote.fail_next_apply(ErrorCode::NetworkFailure);
    engine->run_cycle();

    auto cancelled = engine->cancel(id.value());
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().code, ErrorCode::IllegalTransition);
}

TEST_F(SyncEngineTest, RetryRequiresFailedItem) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}});

    auto retried = engine->retry(id.value());
    ASSERT_TRUE(retried.is_error());
    EXPECT_EQ(retried.error().code, ErrorCode::IllegalTransition);

    auto unknown = engine->retry("item-99");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

// ════════════════════════════════════════════════════════
// Conflicts
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, ManualEntityTypeAlwaysEscalates) {
    auto engine = make_engine();
    engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
    const EntityRef grade{"grade", "7"};

    remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
    clock.advance(1h);
    auto id = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}});

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::ManualPending);

    auto conflicts = engine->list_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].item_id, id.value());
    ASSERT_TRUE(conflicts[0].resolution.has_value());
    EXPECT_EQ(conflicts[0].resolution->kind, osync::sync::ResolutionKind::ManualPending);

    // The entity stays blocked for later edits
    const EntityRef other{"grade", "8"};
    ASSERT_TRUE(engine->enqueue(grade, OperationKind::Update, Payload{{"score", 96}}).is_ok());
    EXPECT_TRUE(engine->run_cycle().is_idle());
    ASSERT_TRUE(engine->enqueue(other, OperationKind::Create, Payload{{"score", 10}}).is_ok());
    EXPECT_EQ(engine->run_cycle().entity, other);
}

TEST_F(SyncEngineTest, ManualKeepLocalPushesLocalVersion) {
    auto engine = make_engine();
    engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
    const EntityRef grade{"grade", "7"};

    remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
    auto id = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}});
    ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);

    ASSERT_TRUE(engine->resolve_manually(id.value(), ManualDecision::keep_local()).is_ok());
    EXPECT_TRUE(engine->list_conflicts().empty());

    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, SyncStatus::Synced);

    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::Synced);
    EXPECT_EQ(remote.remote(grade)->data["score"], 95);
    EXPECT_EQ(engine->local_vector(grade), vv({{"A", 1}, {"B", 1}}));
}

TEST_F(SyncEngineTest, ManualKeepRemoteAdoptsRemoteVersion) {
    auto engine = make_engine();
    engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
    const EntityRef grade{"grade", "7"};

    remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
    auto id = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}});
    ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);

    ASSERT_TRUE(engine->resolve_manually(id.value(), ManualDecision::keep_remote()).is_ok());
    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::Synced);
    EXPECT_EQ(engine->local_vector(grade), vv({{"A", 1}, {"B", 1}}));
    EXPECT_EQ(remote.apply_attempts(), 0u);

    auto twice = engine->resolve_manually(id.value(), ManualDecision::keep_remote());
    ASSERT_TRUE(twice.is_error());
    EXPECT_EQ(twice.error().code, ErrorCode::NotFound);
}

TEST_F(SyncEngineTest, ManualMergeRejectsEmptyPayload) {
    auto engine = make_engine();
    engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
    const EntityRef grade{"grade", "7"};

    remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
    auto id = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}});
    ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);

    auto empty = engine->resolve_manually(id.value(), ManualDecision::use_merged(Payload::object()));
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidPayload);
    EXPECT_EQ(engine->list_conflicts().size(), 1u);

    ASSERT_TRUE(engine->resolve_manually(id.value(), ManualDecision::use_merged(Payload{{"score", 90}})).is_ok());
    engine->drain();
    EXPECT_EQ(remote.remote(grade)->data["score"], 90);
}

TEST_F(SyncEngineTest, FieldMergeCombinesDisjointEdits) {
    auto engine = make_engine();
    engine->resolver().register_policy("post", EntityPolicy{ConflictMode::FieldMerge, {"title", "body"}});

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "t0"}, {"body", "b0"}}).is_ok());
    ASSERT_EQ(engine->drain().size(), 1u);

    // Someone else edits the body while we edit the title
    remote.set_remote(snapshot(kPost, Payload{{"title", "t0"}, {"body", "b1"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));
    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "t1"}, {"body", "b0"}}).is_ok());

    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].outcome, SyncStatus::Conflicted);
    EXPECT_EQ(reports[0].detail, "field-merge");
    EXPECT_EQ(reports[1].outcome, SyncStatus::Synced);

    auto merged = remote.remote(kPost);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->data["title"], "t1");
    EXPECT_EQ(merged->data["body"], "b1");
}

TEST_F(SyncEngineTest, FieldMergeEscalatesOverlappingEdits) {
    auto engine = make_engine();
    engine->resolver().register_policy("post", EntityPolicy{ConflictMode::FieldMerge, {"title", "body"}});

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "t0"}, {"body", "b0"}}).is_ok());
    engine->drain();

    remote.set_remote(snapshot(kPost, Payload{{"title", "t0"}, {"body", "b1"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));
    auto id = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "t0"}, {"body", "b2"}});

    EXPECT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);
    ASSERT_EQ(engine->list_conflicts().size(), 1u);
    EXPECT_EQ(engine->list_conflicts()[0].item_id, id.value());
}

TEST_F(SyncEngineTest, ConflictReportedByApplyIsResolved) {
    auto engine = make_engine();
    auto id = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "mine"}});
    clock.advance(1s);
    remote.conflict_on_next_apply(snapshot(kPost, Payload{{"title", "theirs"}}, vv({{"B", 1}}), clock.now()));

    auto report = engine->run_cycle();
    EXPECT_EQ(report.outcome, SyncStatus::Synced);
    EXPECT_EQ(remote.apply_count(), 0u);
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 1}, {"B", 1}}));
    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::Synced);
}

TEST_F(SyncEngineTest, DismissingFailedFollowUpReopensConflict) {
    auto engine = make_engine();
    remote.set_remote(snapshot(kPost, Payload{{"title", "server"}}, vv({{"B", 1}}), clock.now()));
    clock.advance(1s);
    auto id = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "mine"}});

    ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::Conflicted);
    remote.fail_next_apply(ErrorCode::Rejected, "locked thread");
    auto failed = engine->run_cycle();
    ASSERT_EQ(failed.outcome, SyncStatus::Failed);

    auto cancelled = engine->cancel(failed.item_id);
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().code, ErrorCode::IllegalTransition);

    ASSERT_TRUE(engine->dismiss(failed.item_id).is_ok());
    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::ManualPending);
    ASSERT_EQ(engine->list_conflicts().size(), 1u);
    EXPECT_EQ(engine->list_conflicts()[0].item_id, id.value());

    ASSERT_TRUE(engine->resolve_manually(id.value(), ManualDecision::discard()).is_ok());
    EXPECT_EQ(engine->item(id.value()).value().status(), SyncStatus::Dismissed);
    EXPECT_TRUE(engine->items().empty());
}

TEST_F(SyncEngineTest, RederivePolicyRequeuesCurrentLocalState) {
    auto config = make_config(clock);
    config.superseded_policy = SupersededPolicy::Rederive;
    auto engine = make_engine(config, [](const EntityRef&) {
        return std::optional<Payload>(Payload{{"title", "fresh"}});
    });

    remote.set_remote(snapshot(kPost, Payload{{"title", "server"}}, vv({{"A", 1}, {"B", 1}}), clock.now()));
    ASSERT_TRUE(engine->enqueue(SyncOperation::create(kPost, OperationKind::Update, Payload{{"title", "stale"}},
                                                      Priority::Normal, vv({{"A", 1}}), "A", clock.now()).value()).is_ok());

    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].outcome, SyncStatus::Superseded);
    EXPECT_EQ(reports[1].outcome, SyncStatus::Synced);
    EXPECT_EQ(remote.remote(kPost)->data["title"], "fresh");
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 2}, {"B", 1}}));
}

// ════════════════════════════════════════════════════════
// Streams, persistence, concurrency
// ════════════════════════════════════════════════════════

TEST_F(SyncEngineTest, StatusStreamSeesOnlyItsEntity) {
    auto engine = make_engine();
    auto stream = engine->subscribe_status(kPost);

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}}).is_ok());
    ASSERT_TRUE(engine->enqueue(EntityRef{"post", "2"}, OperationKind::Create, Payload{{"title", "y"}}).is_ok());
    engine->drain();

    auto first = stream->try_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->from, SyncStatus::Pending);
    EXPECT_EQ(first->to, SyncStatus::InFlight);

    auto second = stream->try_next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->to, SyncStatus::Synced);

    EXPECT_FALSE(stream->try_next().has_value());
}

TEST_F(SyncEngineTest, StoreFailureRejectsEnqueue) {
    class BrokenStore : public MemorySyncStore {
    public:
        osync::Result<void> save_item(const osync::sync::SyncItem&) override {
            return osync::Err<void>(osync::make_error(ErrorCode::StorageFailure, "disk full"));
        }
    };
    BrokenStore broken;
    SyncEngine engine(make_config(clock), remote, broken, bus);

    auto id = engine.enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}});
    ASSERT_TRUE(id.is_error());
    EXPECT_EQ(id.error().code, ErrorCode::StorageFailure);
    EXPECT_TRUE(engine.items().empty());
    EXPECT_TRUE(engine.local_vector(kPost).empty());
}

TEST_F(SyncEngineTest, RestoreRecoversQueueAfterRestart) {
    {
        auto engine = make_engine();
        ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}}).is_ok());
        ASSERT_TRUE(engine->enqueue(EntityRef{"post", "2"}, OperationKind::Create, Payload{{"title", "y"}}).is_ok());
    }

    // Pretend the process died while item-1 was on the wire
    auto loaded = store.load_items();
    ASSERT_TRUE(loaded.is_ok());
    auto in_flight = loaded.value().front();
    ASSERT_TRUE(in_flight.advance(SyncStatus::InFlight).is_ok());
    ASSERT_TRUE(store.save_item(in_flight).is_ok());

    auto engine = make_engine();
    auto restored = engine->restore();
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), 2u);
    EXPECT_EQ(engine->local_vector(kPost), vv({{"A", 1}}));

    auto interrupted = engine->item("item-1");
    ASSERT_TRUE(interrupted.is_ok());
    EXPECT_EQ(interrupted.value().status(), SyncStatus::Failed);
    EXPECT_EQ(interrupted.value().state().failure, osync::sync::FailureKind::Network);

    auto fresh = engine->enqueue(EntityRef{"post", "3"}, OperationKind::Create, Payload{{"title", "z"}});
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(fresh.value(), "item-3");

    engine->drain();
    EXPECT_TRUE(engine->items().empty());
    EXPECT_EQ(store.item_count(), 0u);
}

TEST_F(SyncEngineTest, RestoreNeverReusesIdsOfFinishedItems) {
    {
        auto engine = make_engine();
        auto first = engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}});
        ASSERT_TRUE(first.is_ok());
        EXPECT_EQ(first.value(), "item-1");
        engine->drain();
        EXPECT_EQ(store.item_count(), 0u);
    }

    auto engine = make_engine();
    auto restored = engine->restore();
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), 0u);

    auto next = engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "y"}});
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value(), "item-2");
    EXPECT_EQ(engine->item(next.value()).value().sequence(), 2u);

    auto counters = store.load_counters();
    ASSERT_TRUE(counters.is_ok());
    EXPECT_EQ(counters.value().item, 2u);
    EXPECT_EQ(counters.value().sequence, 2u);
}

TEST_F(SyncEngineTest, RestoredManualConflictKeepsRemoteSide) {
    const EntityRef grade{"grade", "7"};
    std::string id;
    {
        auto engine = make_engine();
        engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
        remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
        auto queued = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}});
        ASSERT_TRUE(queued.is_ok());
        id = queued.value();
        ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);
    }

    auto engine = make_engine();
    engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
    ASSERT_TRUE(engine->restore().is_ok());

    auto conflicts = engine->list_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].item_id, id);
    EXPECT_EQ(conflicts[0].remote.data["score"], 80);
    EXPECT_EQ(conflicts[0].remote.vector, vv({{"B", 1}}));
    EXPECT_EQ(conflicts[0].relationship, osync::sync::VectorOrdering::Concurrent);
    auto open = engine->resolver().find_pending(id);
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->remote.modified_by, "B");

    ASSERT_TRUE(engine->resolve_manually(id, ManualDecision::keep_local()).is_ok());
    EXPECT_EQ(engine->resolver().pending_count(), 0u);
    auto reports = engine->drain();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, SyncStatus::Synced);

    EXPECT_EQ(engine->item(id).value().status(), SyncStatus::Synced);
    EXPECT_EQ(remote.remote(grade)->data["score"], 95);
    EXPECT_EQ(engine->local_vector(grade), vv({{"A", 1}, {"B", 1}}));
    EXPECT_TRUE(engine->list_conflicts().empty());
}

TEST_F(SyncEngineTest, RestoredManualConflictCanKeepRemote) {
    const EntityRef grade{"grade", "7"};
    std::string id;
    {
        auto engine = make_engine();
        engine->resolver().register_policy("grade", EntityPolicy{ConflictMode::Manual, {}});
        remote.set_remote(snapshot(grade, Payload{{"score", 80}}, vv({{"B", 1}}), clock.now()));
        id = engine->enqueue(grade, OperationKind::Update, Payload{{"score", 95}}).value();
        ASSERT_EQ(engine->run_cycle().outcome, SyncStatus::ManualPending);
    }

    auto engine = make_engine();
    ASSERT_TRUE(engine->restore().is_ok());
    std::optional<RemoteSnapshot> adopted;
    bus.subscribe<osync::events::RemoteAdoptedEvent>([&](const auto& event) { adopted = event.snapshot; });

    ASSERT_TRUE(engine->resolve_manually(id, ManualDecision::keep_remote()).is_ok());
    EXPECT_EQ(engine->item(id).value().status(), SyncStatus::Synced);
    EXPECT_EQ(engine->local_vector(grade), vv({{"A", 1}, {"B", 1}}));
    ASSERT_TRUE(adopted.has_value());
    EXPECT_EQ(adopted->data["score"], 80);
    EXPECT_EQ(remote.apply_attempts(), 0u);
}

TEST_F(SyncEngineTest, ConcurrentCyclesKeepOneItemInFlightPerEntity) {
    auto engine = make_engine();
    remote.set_apply_delay(2ms);

    std::vector<EntityRef> entities;
    for (int i = 0; i < 4; ++i) {
        entities.push_back(EntityRef{"post", std::to_string(i)});
    }

    std::atomic<bool> done{false};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&]() {
            while (!done) {
                engine->run_cycle();
            }
        });
    }

    for (int round = 0; round < 20; ++round) {
        for (const auto& entity : entities) {
            EXPECT_TRUE(engine->enqueue(entity, OperationKind::Update, Payload{{"round", round}}).is_ok());
        }
        std::this_thread::sleep_for(1ms);
    }
    done = true;
    for (auto& worker : workers) {
        worker.join();
    }

    engine->drain();
    EXPECT_EQ(remote.max_in_flight(), 1);
    EXPECT_TRUE(engine->items().empty());
    for (const auto& entity : entities) {
        auto stored = remote.remote(entity);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->data["round"], 19);
        EXPECT_EQ(stored->vector, engine->local_vector(entity));
    }
}

TEST_F(SyncEngineTest, EventsReachLoggerAndMetrics) {
    osync::events::LoggerComponent logger(bus);
    osync::events::MetricsComponent metrics(bus);
    auto engine = make_engine();

    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Create, Payload{{"title", "x"}}).is_ok());
    ASSERT_TRUE(engine->enqueue(kPost, OperationKind::Update, Payload{{"title", "y"}}).is_ok());
    engine->drain();

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.items_enqueued.load(), 1u);
    EXPECT_EQ(stats.operations_coalesced.load(), 1u);
    EXPECT_EQ(stats.items_synced.load(), 1u);
}
