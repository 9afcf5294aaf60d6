#pragma once

#include "osync/sync/engine.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace osync::sync {

namespace asio = boost::asio;

/**
 * @brief Drives SyncEngine::drain() from a Boost.Asio event loop
 *
 * The scheduler owns no thread. Whoever owns the io_context runs it, and
 * every drain happens on that thread.
 *
 * Timing:
 * - a steady timer fires every interval and drains the engine
 * - notify_connectivity_restored() posts an immediate drain
 * - after each drain the timer is re-armed for the earlier of the interval
 *   and the engine's next backoff deadline
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * SyncScheduler scheduler(io_context, engine, std::chrono::seconds(30));
 * scheduler.start();
 * io_context.run();
 * ```
 */
class SyncScheduler {
public:
    /**
     * @param io_context Event loop (must outlive the scheduler)
     * @param engine Engine to drain (must outlive the scheduler)
     * @param interval Period of the regular drain
     * @param max_cycles_per_drain Bound handed to SyncEngine::drain()
     */
    SyncScheduler(asio::io_context& io_context,
                  SyncEngine& engine,
                  std::chrono::milliseconds interval,
                  std::size_t max_cycles_per_drain = 1024);

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /**
     * @brief Arm the timer; the first drain happens after one interval
     */
    void start();

    /**
     * @brief Cancel the timer; a drain already running finishes
     */
    void stop();

    /**
     * @brief Drain now instead of waiting for the timer
     *
     * Safe to call from any thread.
     */
    void notify_connectivity_restored();

    bool running() const noexcept { return running_.load(); }
    std::uint64_t drain_count() const noexcept { return drains_.load(); }

private:
    void arm(std::chrono::milliseconds delay);
    void run_drain(const char* reason);
    std::chrono::milliseconds next_delay() const;

    asio::io_context& io_context_;
    asio::steady_timer timer_;
    SyncEngine& engine_;
    std::chrono::milliseconds interval_;
    std::size_t max_cycles_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> drains_{0};
};

} // namespace osync::sync
