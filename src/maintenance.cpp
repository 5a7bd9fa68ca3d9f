#include "agentnet/maintenance.hpp"
#include "agentnet/consensus_manager.hpp"
#include "agentnet/logging.hpp"

namespace agentnet
{

    RotationPolicy::RotationPolicy(std::uint64_t interval)
        : interval_(interval == 0 ? 1 : interval)
    {
    }

    bool RotationPolicy::record_event()
    {
        auto n = ++events_;
        return n % interval_ == 0;
    }

    MaintenanceLoop::MaintenanceLoop(ConsensusManager &manager, RetentionConfig cfg)
        : manager_(manager), cfg_(cfg)
    {
    }

    MaintenanceLoop::~MaintenanceLoop()
    {
        stop();
    }

    SweepReport MaintenanceLoop::run_once()
    {
        SweepReport report;
        report.timed_out = manager_.check_timeouts();
        report.removed = manager_.cleanup_old_proposals(cfg_.max_age);
        ++passes_;
        return report;
    }

    void MaintenanceLoop::start()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (thread_.joinable())
            return;
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = false;
        }
        thread_ = std::thread([this] { worker(); });
        logging::get()->debug("maintenance loop started (every {}s)", cfg_.sweep_interval.count());
    }

    void MaintenanceLoop::stop()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (!thread_.joinable())
            return;
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();
        thread_.join();
        logging::get()->debug("maintenance loop stopped after {} passes", passes_.load());
    }

    bool MaintenanceLoop::running() const
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (!thread_.joinable())
            return false;
        std::lock_guard lock(mutex_);
        return !stop_requested_;
    }

    void MaintenanceLoop::worker()
    {
        std::unique_lock lock(mutex_);
        while (!stop_requested_)
        {
            lock.unlock();
            run_once();
            lock.lock();
            cv_.wait_for(lock, cfg_.sweep_interval, [this] { return stop_requested_; });
        }
    }

} // namespace agentnet
