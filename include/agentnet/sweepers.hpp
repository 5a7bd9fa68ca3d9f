#pragma once

#include "committee.hpp"
#include "proposal.hpp"
#include <chrono>
#include <cstddef>

namespace agentnet
{

    /**
     * Moves every open proposal whose deadline has passed to Timeout, attaching
     * a failed result built from the votes recorded at sweep time.
     */
    class TimeoutSweeper
    {
    public:
        TimeoutSweeper(const CommitteeManager &committee, ProposalStore &store);

        /** Returns the number of proposals transitioned. Terminal proposals are skipped. */
        std::size_t sweep(TimePoint now);

    private:
        const CommitteeManager &committee_;
        ProposalStore &store_;
    };

    /**
     * Purges terminal proposals created before now - max_age. Open proposals
     * are never removed.
     */
    class RetentionSweeper
    {
    public:
        explicit RetentionSweeper(ProposalStore &store);

        std::size_t sweep(std::chrono::seconds max_age, TimePoint now);

    private:
        ProposalStore &store_;
    };

} // namespace agentnet
