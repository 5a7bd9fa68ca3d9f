#pragma once

#include "agentnet/clock.hpp"
#include "agentnet/committee.hpp"
#include "agentnet/hooks.hpp"
#include "agentnet/message.hpp"
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

namespace agentnet::testing
{
    /** Clock that only moves when told to */
    class ManualClock : public Clock
    {
    public:
        ManualClock() : ticks_(std::chrono::system_clock::now().time_since_epoch().count()) {}

        TimePoint now() const override
        {
            return TimePoint{TimePoint::duration{ticks_.load()}};
        }

        void advance(std::chrono::seconds by)
        {
            ticks_ += std::chrono::duration_cast<TimePoint::duration>(by).count();
        }

    private:
        std::atomic<TimePoint::rep> ticks_;
    };

    class RecordingBroadcaster : public Broadcaster
    {
    public:
        Result<void> broadcast(const ConsensusMessage &message) override
        {
            std::lock_guard lock(mutex_);
            sent_.push_back(message);
            return {};
        }

        std::vector<ConsensusMessage> sent() const
        {
            std::lock_guard lock(mutex_);
            return sent_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<ConsensusMessage> sent_;
    };

    inline std::vector<CommitteeMember> members(std::initializer_list<const char *> ids)
    {
        std::vector<CommitteeMember> out;
        double rep = 50.0;
        for (const char *id : ids)
        {
            CommitteeMember m;
            m.node_id = id;
            m.reputation = rep;
            rep += 10.0;
            out.push_back(std::move(m));
        }
        return out;
    }

    inline Vote vote_from(std::string voter, bool decision)
    {
        Vote v;
        v.voter_id = std::move(voter);
        v.decision = decision;
        return v;
    }

} // namespace agentnet::testing
