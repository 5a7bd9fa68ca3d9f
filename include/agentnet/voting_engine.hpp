#pragma once

#include "committee.hpp"
#include "proposal.hpp"
#include <string_view>

namespace agentnet
{

    /**
     * Records one vote per member per proposal and evaluates quorum after
     * every accepted vote. Callers hold ConsensusManager's exclusive lock
     * across admit() and record() so the tally and the quorum check are atomic.
     */
    class VotingEngine
    {
    public:
        VotingEngine(const CommitteeManager &committee, ProposalStore &store);

        /**
         * Admission checks, in order: voter is a member, proposal exists,
         * proposal not terminal (DeadlinePassed for Timeout, ProposalClosed
         * otherwise), no prior vote by the voter, deadline not passed.
         * A proposal found past its deadline is moved to Timeout before the
         * DeadlinePassed error is returned.
         */
        Result<Proposal *> admit(std::string_view proposal_id, std::string_view voter_id, TimePoint now);

        /** Store an admitted vote and evaluate quorum. Returns the resulting phase. */
        Phase record(Proposal &proposal, Vote vote, TimePoint now);

        /**
         * Finalize when agree >= quorum; reject when quorum is unreachable even if
         * every remaining member agreed; otherwise stay Pending.
         */
        Phase evaluate(Proposal &proposal, TimePoint now) const;

    private:
        const CommitteeManager &committee_;
        ProposalStore &store_;
    };

} // namespace agentnet
