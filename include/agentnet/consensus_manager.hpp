#pragma once

#include "clock.hpp"
#include "committee.hpp"
#include "config.hpp"
#include "hooks.hpp"
#include "message.hpp"
#include "proposal.hpp"
#include "sweepers.hpp"
#include "voting_engine.hpp"
#include <spdlog/logger.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentnet
{

    /**
     * One node's view of committee consensus.
     *
     * Mutating operations take an exclusive lock over the committee and the
     * proposal index for their whole duration; queries take a shared lock and
     * return copies. Broadcasts happen after the lock is released and their
     * failures are only logged.
     */
    class ConsensusManager
    {
    public:
        ConsensusManager(std::string node_id,
                         ConsensusConfig cfg = {},
                         ConsensusHooks hooks = {},
                         std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

        ConsensusManager(const ConsensusManager &) = delete;
        ConsensusManager &operator=(const ConsensusManager &) = delete;

        const std::string &node_id() const { return node_id_; }
        const ConsensusConfig &config() const { return cfg_; }

        // Committee

        /**
         * Replace the committee; member 0 becomes leader. Open proposals now count against it.
         * Node ids must be non-empty and unique.
         */
        Result<void> set_committee(std::vector<CommitteeMember> members);

        void rotate_leader();

        Committee committee() const;

        bool is_committee_member() const;

        bool is_leader() const;

        std::optional<CommitteeMember> leader() const;

        std::size_t quorum_size() const;

        /** Reputation of a member from the injected source, else the stored score. None for non-members. */
        std::optional<double> member_reputation(std::string_view node_id) const;

        // Proposals

        Result<Proposal> create_proposal(ProposalType type, nlohmann::json data);

        Result<Proposal> propose_join(const JoinProposalData &data);

        Result<Proposal> propose_kick(const KickProposalData &data);

        /** Cast the local node's vote. See VotingEngine::admit for the refusal order. */
        Result<void> vote(std::string_view proposal_id, bool decision, std::string reason = {});

        /**
         * Ingest a vote cast by another committee member. Admission runs first,
         * in the same order as vote(); then, with a verifier configured, the
         * signature over the canonical vote bytes must verify.
         */
        Result<void> receive_vote(std::string_view proposal_id, Vote vote);

        /** Apply a PRE_PREPARE (import proposal) or PREPARE (remote vote) from a peer */
        Result<void> handle_message(const ConsensusMessage &message);

        std::optional<Proposal> proposal(std::string_view id) const;

        std::optional<ConsensusResult> proposal_result(std::string_view id) const;

        std::vector<Proposal> pending_proposals() const;

        std::size_t proposal_count() const;

        // Maintenance

        std::size_t check_timeouts();

        std::size_t cleanup_old_proposals(std::chrono::seconds max_age);

        /** Drop every proposal */
        void reset();

    private:
        Result<void> import_proposal(const ConsensusMessage &message);
        void log_phase(const Proposal &proposal) const;
        void broadcast(ConsensusMessage message);

        const std::string node_id_;
        const ConsensusConfig cfg_;
        const ConsensusHooks hooks_;
        std::shared_ptr<Clock> clock_;
        std::shared_ptr<spdlog::logger> log_;

        mutable std::shared_mutex mutex_;
        CommitteeManager committee_;
        ProposalStore store_;
        VotingEngine voting_;
        TimeoutSweeper timeouts_;
        RetentionSweeper retention_;
        std::uint64_t sequence_{0};
    };

} // namespace agentnet
