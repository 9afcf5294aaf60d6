#include "osync/sync/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace osync::sync {

SyncScheduler::SyncScheduler(asio::io_context& io_context,
                             SyncEngine& engine,
                             std::chrono::milliseconds interval,
                             std::size_t max_cycles_per_drain)
    : io_context_(io_context)
    , timer_(io_context)
    , engine_(engine)
    , interval_(interval)
    , max_cycles_(max_cycles_per_drain) {
}

void SyncScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Sync scheduler started (interval {} ms)", interval_.count());
    asio::post(io_context_, [this]() { arm(interval_); });
}

void SyncScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("Sync scheduler stopped after {} drains", drains_.load());
    asio::post(io_context_, [this]() { timer_.cancel(); });
}

void SyncScheduler::notify_connectivity_restored() {
    asio::post(io_context_, [this]() {
        if (!running_) {
            return;
        }
        run_drain("connectivity restored");
        arm(next_delay());
    });
}

void SyncScheduler::arm(std::chrono::milliseconds delay) {
    if (!running_) {
        return;
    }
    // Re-arming cancels the pending wait; its handler sees operation_aborted
    timer_.expires_after(delay);
    timer_.async_wait([this](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::error("Sync timer failed: {}", ec.message());
            return;
        }
        run_drain("timer");
        arm(next_delay());
    });
}

void SyncScheduler::run_drain(const char* reason) {
    const auto reports = engine_.drain(max_cycles_);
    drains_++;
    spdlog::debug("Drain ({}) processed {} items, {} still pending",
                  reason, reports.size(), engine_.pending_count());
}

std::chrono::milliseconds SyncScheduler::next_delay() const {
    const auto wakeup = engine_.next_wakeup();
    if (!wakeup) {
        return interval_;
    }
    const auto now = engine_.config().clock();
    // A deadline already behind us belongs to an item the drain could not
    // take (blocked entity), so it waits for the regular tick
    if (*wakeup <= now) {
        return interval_;
    }
    const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*wakeup - now);
    return std::min(interval_, std::max(until, std::chrono::milliseconds(1)));
}

} // namespace osync::sync
