#pragma once

#include "osync/core/config.hpp"
#include "osync/sync/remote.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace osync::testing {

/**
 * @brief Clock that only moves when told to
 */
class ManualClock {
public:
    ManualClock() : now_(sync::Timestamp{} + std::chrono::hours(24 * 365 * 50)) {}

    sync::Timestamp now() const {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds step) {
        std::lock_guard lock(mutex_);
        now_ += step;
    }

    std::function<sync::Timestamp()> as_function() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    sync::Timestamp now_;
};

inline EngineConfig make_config(ManualClock& clock, std::string node_id = "A") {
    EngineConfig config;
    config.node_id = std::move(node_id);
    config.clock = clock.as_function();
    return config;
}

/**
 * @brief In-memory remote with scripted failures
 *
 * Applies behave like a server that accepts causally newer writes: the
 * stored vector becomes the merge of the old one and the operation's.
 */
class FakeRemote : public sync::RemoteService {
public:
    explicit FakeRemote(ManualClock* clock = nullptr) : clock_(clock) {}

    Result<std::optional<sync::RemoteSnapshot>> fetch_remote(const sync::EntityRef& entity,
                                                             sync::Timestamp) override {
        std::lock_guard lock(mutex_);
        ++fetch_count_;
        if (!fetch_failures_.empty()) {
            auto error = fetch_failures_.front();
            fetch_failures_.pop_front();
            return Err<std::optional<sync::RemoteSnapshot>>(error);
        }
        const auto it = entities_.find(entity);
        if (it == entities_.end()) {
            return Ok(std::optional<sync::RemoteSnapshot>());
        }
        return Ok(std::optional<sync::RemoteSnapshot>(it->second));
    }

    Result<sync::VersionVector> apply_remote(const sync::SyncOperation& operation,
                                             sync::Timestamp) override {
        const auto& entity = operation.entity();
        {
            std::lock_guard lock(mutex_);
            auto& active = in_flight_[entity];
            ++active;
            max_in_flight_ = std::max(max_in_flight_, active);
        }
        if (apply_delay_.count() > 0) {
            std::this_thread::sleep_for(apply_delay_);
        }

        std::lock_guard lock(mutex_);
        --in_flight_[entity];
        ++apply_attempts_;

        if (conflict_on_next_apply_) {
            entities_.insert_or_assign(entity, *conflict_on_next_apply_);
            conflict_on_next_apply_.reset();
            return Fail<sync::VersionVector>(ErrorCode::Concurrent, "Remote has a newer version");
        }
        if (!apply_failures_.empty()) {
            auto error = apply_failures_.front();
            apply_failures_.pop_front();
            return Err<sync::VersionVector>(error);
        }
        if (always_fail_) {
            return Err<sync::VersionVector>(*always_fail_);
        }

        auto& snapshot = entities_[entity];
        snapshot.entity = entity;
        snapshot.vector = snapshot.vector.merge(operation.vector());
        snapshot.modified_at = operation.created_at();
        snapshot.modified_by = operation.origin_node();
        switch (operation.kind()) {
            case sync::OperationKind::Delete:
                snapshot.deleted = true;
                snapshot.data = nullptr;
                break;
            case sync::OperationKind::Update:
                if (snapshot.data.is_object() && operation.payload().is_object()) {
                    snapshot.data.update(operation.payload());
                    break;
                }
                snapshot.data = operation.payload();
                break;
            case sync::OperationKind::Create:
                snapshot.deleted = false;
                snapshot.data = operation.payload();
                break;
        }
        applied_.push_back(operation);

        // The write lands, but the answer arrives late
        if (clock_ && latency_.count() > 0) {
            clock_->advance(latency_);
        }
        return Ok(snapshot.vector);
    }

    void set_remote(sync::RemoteSnapshot snapshot) {
        std::lock_guard lock(mutex_);
        auto key = snapshot.entity;
        entities_.insert_or_assign(std::move(key), std::move(snapshot));
    }

    std::optional<sync::RemoteSnapshot> remote(const sync::EntityRef& entity) const {
        std::lock_guard lock(mutex_);
        const auto it = entities_.find(entity);
        if (it == entities_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void fail_next_fetch(ErrorCode code, std::string message = "offline") {
        std::lock_guard lock(mutex_);
        fetch_failures_.push_back(make_error(code, std::move(message)));
    }

    void fail_next_apply(ErrorCode code, std::string message = "offline") {
        std::lock_guard lock(mutex_);
        apply_failures_.push_back(make_error(code, std::move(message)));
    }

    void fail_every_apply(ErrorCode code, std::string message = "offline") {
        std::lock_guard lock(mutex_);
        always_fail_ = make_error(code, std::move(message));
    }

    void conflict_on_next_apply(sync::RemoteSnapshot newer) {
        std::lock_guard lock(mutex_);
        conflict_on_next_apply_ = std::move(newer);
    }

    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }
    void set_apply_delay(std::chrono::milliseconds delay) { apply_delay_ = delay; }

    std::vector<sync::SyncOperation> applied() const {
        std::lock_guard lock(mutex_);
        return applied_;
    }

    std::size_t apply_count() const {
        std::lock_guard lock(mutex_);
        return applied_.size();
    }

    std::size_t apply_attempts() const {
        std::lock_guard lock(mutex_);
        return apply_attempts_;
    }

    std::size_t fetch_count() const {
        std::lock_guard lock(mutex_);
        return fetch_count_;
    }

    int max_in_flight() const {
        std::lock_guard lock(mutex_);
        return max_in_flight_;
    }

private:
    ManualClock* clock_;
    mutable std::mutex mutex_;
    std::map<sync::EntityRef, sync::RemoteSnapshot> entities_;
    std::deque<Error> fetch_failures_;
    std::deque<Error> apply_failures_;
    std::optional<Error> always_fail_;
    std::optional<sync::RemoteSnapshot> conflict_on_next_apply_;
    std::vector<sync::SyncOperation> applied_;
    std::map<sync::EntityRef, int> in_flight_;
    std::chrono::milliseconds latency_{0};
    std::chrono::milliseconds apply_delay_{0};
    std::size_t fetch_count_ = 0;
    std::size_t apply_attempts_ = 0;
    int max_in_flight_ = 0;
};

} // namespace osync::testing
