/**
 * @file offline_sync_demo.cpp
 * @brief Offline edits, reconnect, conflicts
 *
 * WHAT IT SHOWS:
 * - Edits made while offline are queued and persisted to a JSON file
 * - The scheduler drains the queue once connectivity comes back
 * - A forum post edited on two devices is field-merged
 * - A grade edited on two devices waits for a manual decision
 *
 * USAGE:
 *   offline_sync_demo [config.json] [queue.json]
 */

#include "osync/core/config.hpp"
#include "osync/events/components.hpp"
#include "osync/store/json_file_store.hpp"
#include "osync/sync/engine.hpp"
#include "osync/sync/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <map>
#include <mutex>

using namespace osync;
using namespace osync::sync;
using namespace std::chrono_literals;

namespace {

// Stands in for the forum and LMS HTTP clients
class InMemoryRemote : public RemoteService {
public:
    void set_online(bool online) {
        online_ = online;
        spdlog::info("Network is now {}", online ? "ONLINE" : "OFFLINE");
    }

    // An edit made by another device directly on the server
    void edit_from_other_device(const EntityRef& entity, Payload data) {
        std::lock_guard lock(mutex_);
        auto& snapshot = entities_[entity];
        snapshot.entity = entity;
        snapshot.data = std::move(data);
        snapshot.vector = snapshot.vector.increment("web");
        snapshot.modified_at = std::chrono::system_clock::now();
        snapshot.modified_by = "web";
    }

    Result<std::optional<RemoteSnapshot>> fetch_remote(const EntityRef& entity, Timestamp) override {
        if (!online_) {
            return Fail<std::optional<RemoteSnapshot>>(ErrorCode::NetworkFailure, "no route to host");
        }
        std::lock_guard lock(mutex_);
        const auto it = entities_.find(entity);
        if (it == entities_.end()) {
            return Ok(std::optional<RemoteSnapshot>());
        }
        return Ok(std::optional<RemoteSnapshot>(it->second));
    }

    Result<VersionVector> apply_remote(const SyncOperation& operation, Timestamp) override {
        if (!online_) {
            return Fail<VersionVector>(ErrorCode::NetworkFailure, "no route to host");
        }
        std::lock_guard lock(mutex_);
        auto& snapshot = entities_[operation.entity()];
        snapshot.entity = operation.entity();
        snapshot.vector = snapshot.vector.merge(operation.vector());
        snapshot.deleted = operation.kind() == OperationKind::Delete;
        if (operation.kind() == OperationKind::Update && snapshot.data.is_object()) {
            snapshot.data.update(operation.payload());
        } else {
            snapshot.data = operation.payload();
        }
        snapshot.modified_at = operation.created_at();
        snapshot.modified_by = operation.origin_node();
        return Ok(snapshot.vector);
    }

private:
    std::atomic<bool> online_{false};
    std::mutex mutex_;
    std::map<EntityRef, RemoteSnapshot> entities_;
};

LoadedConfig default_config() {
    LoadedConfig config;
    config.engine.node_id = "laptop";
    config.engine.base_backoff = 200ms;
    config.engine.max_backoff = 2s;
    config.policies["forum_post"] = EntityPolicy{ConflictMode::FieldMerge, {"title", "body", "tags"}};
    config.policies["grade"] = EntityPolicy{ConflictMode::Manual, {}};
    return config;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Offline Sync Demo");
    spdlog::info("═══════════════════════════════════════");

    LoadedConfig config = default_config();
    if (argc > 1) {
        auto loaded = load_engine_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().message);
            return 1;
        }
        config = std::move(loaded.value());
    }

    const std::filesystem::path queue_path = argc > 2
        ? std::filesystem::path(argv[2])
        : std::filesystem::temp_directory_path() / "osync_demo_queue.json";
    auto store = store::JsonFileSyncStore::open(queue_path);
    if (store.is_error()) {
        spdlog::error("{}", store.error().message);
        return 1;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    InMemoryRemote remote;
    SyncEngine engine(config.engine, remote, *store.value(), bus);
    register_policies(config, engine.resolver());

    auto restored = engine.restore();
    if (restored.is_error()) {
        spdlog::error("Restore failed: {}", restored.error().message);
        return 1;
    }

    const EntityRef post{"forum_post", "1432"};
    const EntityRef grade{"grade", "alice-hw3"};

    // Both devices start from the same synced versions
    remote.set_online(true);
    if (engine.enqueue(post, OperationKind::Create, Payload{{"title", "Week 3"}, {"body", "Draft"}}).is_error() ||
        engine.enqueue(grade, OperationKind::Create, Payload{{"score", 80}}).is_error()) {
        spdlog::error("Could not queue initial edits");
        return 1;
    }
    engine.drain();

    // Offline: edits pile up, the badge stream shows their progress
    remote.set_online(false);
    auto badge = engine.subscribe_status(post);
    (void)engine.enqueue(post, OperationKind::Update, Payload{{"title", "Week 3: Recursion"}});
    (void)engine.enqueue(grade, OperationKind::Update, Payload{{"score", 85}});
    remote.edit_from_other_device(post, Payload{{"title", "Week 3"}, {"body", "Final text"}});
    remote.edit_from_other_device(grade, Payload{{"score", 90}});
    engine.drain();

    asio::io_context io_context;
    SyncScheduler scheduler(io_context, engine, 250ms);
    scheduler.start();

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        scheduler.stop();
        io_context.stop();
    });

    asio::steady_timer reconnect(io_context, 500ms);
    reconnect.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        remote.set_online(true);
        scheduler.notify_connectivity_restored();
    });

    io_context.run_for(3s);
    scheduler.stop();

    while (auto change = badge->try_next()) {
        spdlog::info("Badge {}: {} -> {}", post.to_string(), to_string(change->from), to_string(change->to));
    }

    for (const auto& conflict : engine.list_conflicts()) {
        spdlog::info("Manual decision needed for {} (local {} vs remote {}), keeping the higher score",
                     conflict.local.entity().to_string(), conflict.local.payload().dump(), conflict.remote.data.dump());
        auto resolved = engine.resolve_manually(conflict.item_id, ManualDecision::use_merged(Payload{{"score", 90}}));
        if (resolved.is_error()) {
            spdlog::error("{}", resolved.error().message);
        }
    }
    engine.drain();

    for (const auto& item : engine.items()) {
        spdlog::info("Still queued: {} {} {}", item.id(), item.entity().to_string(), to_string(item.status()));
    }
    metrics.print_stats();
    return 0;
}
