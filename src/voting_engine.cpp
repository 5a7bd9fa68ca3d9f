#include "agentnet/voting_engine.hpp"
#include <format>

namespace agentnet
{

    VotingEngine::VotingEngine(const CommitteeManager &committee, ProposalStore &store)
        : committee_(committee), store_(store)
    {
    }

    Result<Proposal *> VotingEngine::admit(std::string_view proposal_id, std::string_view voter_id, TimePoint now)
    {
        if (!committee_.is_member(voter_id))
            return std::unexpected(ConsensusError::not_member(std::format("not a committee member: {}", voter_id)));

        auto *proposal = store_.find(proposal_id);
        if (!proposal)
            return std::unexpected(ConsensusError::not_found(std::format("proposal not found: {}", proposal_id)));

        if (proposal->phase == Phase::Timeout)
            return std::unexpected(ConsensusError::deadline_passed("voting deadline passed"));

        if (proposal->is_terminal())
        {
            return std::unexpected(ConsensusError::closed(
                std::format("proposal already {}", phase_to_string(proposal->phase))));
        }

        if (proposal->has_voted(voter_id))
            return std::unexpected(ConsensusError::duplicate_vote(std::format("already voted: {}", voter_id)));

        if (proposal->deadline_passed(now))
        {
            conclude(*proposal, Phase::Timeout, false, "timeout", committee_.size(), committee_.quorum_fraction(), now);
            return std::unexpected(ConsensusError::deadline_passed("voting deadline passed"));
        }

        return proposal;
    }

    Phase VotingEngine::record(Proposal &proposal, Vote vote, TimePoint now)
    {
        auto voter = vote.voter_id;
        proposal.votes.emplace(std::move(voter), std::move(vote));
        return evaluate(proposal, now);
    }

    Phase VotingEngine::evaluate(Proposal &proposal, TimePoint now) const
    {
        if (proposal.is_terminal())
            return proposal.phase;

        const auto agree = proposal.count_votes(true);
        const auto cast = proposal.votes.size();
        const auto total = committee_.size();
        const auto quorum = committee_.quorum_size();

        if (agree >= quorum)
        {
            conclude(proposal, Phase::Finalized, true, "quorum reached", total, committee_.quorum_fraction(), now);
            return proposal.phase;
        }

        // Votes from members that left the committee can make cast exceed total.
        const auto remaining = total > cast ? total - cast : 0;
        if (agree + remaining < quorum)
        {
            conclude(proposal, Phase::Rejected, false, "cannot reach quorum", total, committee_.quorum_fraction(), now);
        }
        return proposal.phase;
    }

} // namespace agentnet
