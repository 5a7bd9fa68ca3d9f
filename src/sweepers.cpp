#include "agentnet/sweepers.hpp"

namespace agentnet
{

    TimeoutSweeper::TimeoutSweeper(const CommitteeManager &committee, ProposalStore &store)
        : committee_(committee), store_(store)
    {
    }

    std::size_t TimeoutSweeper::sweep(TimePoint now)
    {
        std::size_t count = 0;
        for (auto &[_, p] : store_.entries())
        {
            if (p.is_terminal() || !p.deadline_passed(now))
                continue;
            conclude(p, Phase::Timeout, false, "timeout", committee_.size(), committee_.quorum_fraction(), now);
            ++count;
        }
        return count;
    }

    RetentionSweeper::RetentionSweeper(ProposalStore &store)
        : store_(store)
    {
    }

    std::size_t RetentionSweeper::sweep(std::chrono::seconds max_age, TimePoint now)
    {
        const auto cutoff = now - max_age;
        return static_cast<std::size_t>(std::erase_if(store_.entries(), [cutoff](const auto &kv) {
            return kv.second.is_terminal() && kv.second.created_at < cutoff;
        }));
    }

} // namespace agentnet
