#pragma once

#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace agentnet
{
    class ConsensusManager;

    /**
     * Counts host events and signals when the leader should rotate.
     * The core never rotates on its own; the host calls rotate_leader().
     */
    class RotationPolicy
    {
    public:
        explicit RotationPolicy(std::uint64_t interval);

        /** Record one event; true on every interval-th event. */
        bool record_event();

        std::uint64_t events() const { return events_.load(); }

    private:
        std::uint64_t interval_;
        std::atomic<std::uint64_t> events_{0};
    };

    struct SweepReport
    {
        std::size_t timed_out{0};
        std::size_t removed{0};
    };

    /**
     * Optional self-driving sweeps: a background thread calls check_timeouts()
     * and cleanup_old_proposals() every sweep_interval until stopped.
     */
    class MaintenanceLoop
    {
    public:
        MaintenanceLoop(ConsensusManager &manager, RetentionConfig cfg);
        ~MaintenanceLoop();

        MaintenanceLoop(const MaintenanceLoop &) = delete;
        MaintenanceLoop &operator=(const MaintenanceLoop &) = delete;

        /** One synchronous pass */
        SweepReport run_once();

        void start();

        /** Wake the worker and join it. Safe to call repeatedly and from several threads. */
        void stop();

        bool running() const;

        std::uint64_t passes() const { return passes_.load(); }

    private:
        void worker();

        ConsensusManager &manager_;
        RetentionConfig cfg_;
        mutable std::mutex lifecycle_mutex_; // serialises start/stop and guards thread_
        mutable std::mutex mutex_;            // guards stop_requested_
        std::condition_variable cv_;
        bool stop_requested_{false};
        std::thread thread_;
        std::atomic<std::uint64_t> passes_{0};
    };

} // namespace agentnet
