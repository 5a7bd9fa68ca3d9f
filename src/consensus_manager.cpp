#include "agentnet/consensus_manager.hpp"
#include "agentnet/logging.hpp"
#include "agentnet/signing.hpp"
#include <format>
#include <mutex>

namespace agentnet
{

    ConsensusManager::ConsensusManager(std::string node_id,
                                       ConsensusConfig cfg,
                                       ConsensusHooks hooks,
                                       std::shared_ptr<Clock> clock)
        : node_id_(std::move(node_id)),
          cfg_(std::move(cfg)),
          hooks_(std::move(hooks)),
          clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
          log_(logging::get()),
          committee_(cfg_.voting.quorum_fraction),
          store_(cfg_.voting.max_pending, cfg_.voting.voting_timeout),
          voting_(committee_, store_),
          timeouts_(committee_, store_),
          retention_(store_)
    {
    }

    // ============================================================================
    // Committee
    // ============================================================================

    Result<void> ConsensusManager::set_committee(std::vector<CommitteeMember> members)
    {
        std::unique_lock lock(mutex_);
        auto now = clock_->now();
        for (auto &m : members)
        {
            if (m.joined_at == TimePoint{})
                m.joined_at = now;
        }

        const auto size = members.size();
        if (size < cfg_.committee.min_size || size > cfg_.committee.max_size)
        {
            log_->warn("committee size {} outside configured bounds [{}, {}]",
                       size, cfg_.committee.min_size, cfg_.committee.max_size);
        }

        if (auto res = committee_.set_committee(std::move(members), now); !res)
        {
            log_->warn("committee update refused: {}", res.error().what());
            return res;
        }
        log_->info("committee set: {} members, quorum {}, leader {}",
                   size, committee_.quorum_size(),
                   committee_.leader() ? committee_.leader()->node_id : "<none>");
        return {};
    }

    void ConsensusManager::rotate_leader()
    {
        std::unique_lock lock(mutex_);
        if (committee_.size() == 0)
            return;
        committee_.rotate_leader(clock_->now());
        log_->info("leader rotated to {} (rotation {})",
                   committee_.leader()->node_id, committee_.committee().rotation_sequence);
    }

    Committee ConsensusManager::committee() const
    {
        std::shared_lock lock(mutex_);
        return committee_.committee();
    }

    bool ConsensusManager::is_committee_member() const
    {
        std::shared_lock lock(mutex_);
        return committee_.is_member(node_id_);
    }

    bool ConsensusManager::is_leader() const
    {
        std::shared_lock lock(mutex_);
        auto leader = committee_.leader();
        return leader && leader->node_id == node_id_;
    }

    std::optional<CommitteeMember> ConsensusManager::leader() const
    {
        std::shared_lock lock(mutex_);
        return committee_.leader();
    }

    std::size_t ConsensusManager::quorum_size() const
    {
        std::shared_lock lock(mutex_);
        return committee_.quorum_size();
    }

    std::optional<double> ConsensusManager::member_reputation(std::string_view node_id) const
    {
        std::shared_lock lock(mutex_);
        const auto *member = committee_.committee().find(node_id);
        if (!member)
            return std::nullopt;
        if (hooks_.reputation)
            return hooks_.reputation->reputation(node_id);
        return member->reputation;
    }

    // ============================================================================
    // Proposals
    // ============================================================================

    Result<Proposal> ConsensusManager::create_proposal(ProposalType type, nlohmann::json data)
    {
        Proposal created;
        ConsensusMessage announcement;
        {
            std::unique_lock lock(mutex_);
            auto now = clock_->now();
            auto res = store_.create(type, std::move(data), node_id_, now);
            if (!res)
            {
                log_->warn("proposal creation refused: {}", res.error().what());
                return res;
            }
            created = std::move(*res);
            announcement = ConsensusMessage::pre_prepare(
                created, ++sequence_, committee_.committee().rotation_sequence, node_id_, now);
        }

        log_->info("proposal {} created ({})", created.id, proposal_type_to_string(created.type));
        broadcast(std::move(announcement));
        return created;
    }

    Result<Proposal> ConsensusManager::propose_join(const JoinProposalData &data)
    {
        return create_proposal(ProposalType::Join, data.to_json());
    }

    Result<Proposal> ConsensusManager::propose_kick(const KickProposalData &data)
    {
        return create_proposal(ProposalType::Kick, data.to_json());
    }

    Result<void> ConsensusManager::vote(std::string_view proposal_id, bool decision, std::string reason)
    {
        ConsensusMessage outgoing;
        {
            std::unique_lock lock(mutex_);
            auto now = clock_->now();
            auto admitted = voting_.admit(proposal_id, node_id_, now);
            if (!admitted)
            {
                if (admitted.error().code == ErrorCode::DeadlinePassed)
                    log_->info("proposal {} timed out on late vote", proposal_id);
                else
                    log_->debug("vote on {} refused: {}", proposal_id, admitted.error().what());
                return std::unexpected(admitted.error());
            }

            Proposal &proposal = **admitted;
            Vote vote{node_id_, decision, std::move(reason), now, {}};
            if (hooks_.signer)
            {
                auto sig = hooks_.signer->sign(canonical_vote_bytes(proposal.id, node_id_, decision));
                if (!sig)
                {
                    return std::unexpected(ConsensusError::signing(
                        std::format("failed to sign vote: {}", sig.error().what())));
                }
                vote.signature = std::move(*sig);
            }

            outgoing = ConsensusMessage::prepare(
                proposal.id, ++sequence_, committee_.committee().rotation_sequence, node_id_, vote, now);
            voting_.record(proposal, std::move(vote), now);
            log_phase(proposal);
        }

        broadcast(std::move(outgoing));
        return {};
    }

    Result<void> ConsensusManager::receive_vote(std::string_view proposal_id, Vote vote)
    {
        std::unique_lock lock(mutex_);
        auto now = clock_->now();
        auto admitted = voting_.admit(proposal_id, vote.voter_id, now);
        if (!admitted)
        {
            log_->debug("remote vote from {} on {} refused: {}", vote.voter_id, proposal_id, admitted.error().what());
            return std::unexpected(admitted.error());
        }

        // Signature is checked last, after admission, and before anything is stored.
        if (hooks_.verifier &&
            !hooks_.verifier->verify(vote.voter_id,
                                     canonical_vote_bytes(proposal_id, vote.voter_id, vote.decision),
                                     vote.signature))
        {
            log_->warn("rejected vote from {} on {}: bad signature", vote.voter_id, proposal_id);
            return std::unexpected(ConsensusError::invalid_signature(
                std::format("vote signature from {} does not verify", vote.voter_id)));
        }

        Proposal &proposal = **admitted;
        voting_.record(proposal, std::move(vote), now);
        log_phase(proposal);
        return {};
    }

    Result<void> ConsensusManager::handle_message(const ConsensusMessage &message)
    {
        if (hooks_.verifier &&
            !hooks_.verifier->verify(message.sender_id, message.signing_bytes(), message.signature))
        {
            return std::unexpected(ConsensusError::invalid_signature(
                std::format("message from {} does not verify", message.sender_id)));
        }

        switch (message.type)
        {
        case MessageType::PrePrepare:
            return import_proposal(message);
        case MessageType::Prepare:
        {
            auto vote = message.vote();
            if (!vote)
                return std::unexpected(vote.error());
            if (vote->voter_id != message.sender_id)
                return std::unexpected(ConsensusError::invalid_input("vote relayed by a node other than its voter"));
            return receive_vote(message.proposal_id, std::move(*vote));
        }
        }
        return std::unexpected(ConsensusError::invalid_input("unsupported message type"));
    }

    Result<void> ConsensusManager::import_proposal(const ConsensusMessage &message)
    {
        auto proposal = message.proposal();
        if (!proposal)
            return std::unexpected(proposal.error());

        std::unique_lock lock(mutex_);
        if (!committee_.is_member(message.sender_id))
        {
            return std::unexpected(ConsensusError::not_member(
                std::format("proposal announced by non-member {}", message.sender_id)));
        }
        if (auto res = store_.import(std::move(*proposal)); !res)
            return res;

        log_->info("proposal {} imported from {}", message.proposal_id, message.sender_id);
        return {};
    }

    std::optional<Proposal> ConsensusManager::proposal(std::string_view id) const
    {
        std::shared_lock lock(mutex_);
        const auto *p = store_.find(id);
        if (!p)
            return std::nullopt;
        return *p;
    }

    std::optional<ConsensusResult> ConsensusManager::proposal_result(std::string_view id) const
    {
        std::shared_lock lock(mutex_);
        const auto *p = store_.find(id);
        if (!p)
            return std::nullopt;
        return p->result;
    }

    std::vector<Proposal> ConsensusManager::pending_proposals() const
    {
        std::shared_lock lock(mutex_);
        return store_.pending();
    }

    std::size_t ConsensusManager::proposal_count() const
    {
        std::shared_lock lock(mutex_);
        return store_.size();
    }

    // ============================================================================
    // Maintenance
    // ============================================================================

    std::size_t ConsensusManager::check_timeouts()
    {
        std::unique_lock lock(mutex_);
        auto count = timeouts_.sweep(clock_->now());
        if (count > 0)
            log_->info("{} proposal(s) timed out", count);
        return count;
    }

    std::size_t ConsensusManager::cleanup_old_proposals(std::chrono::seconds max_age)
    {
        std::unique_lock lock(mutex_);
        auto count = retention_.sweep(max_age, clock_->now());
        if (count > 0)
            log_->info("removed {} resolved proposal(s) older than {}s", count, max_age.count());
        return count;
    }

    void ConsensusManager::reset()
    {
        std::unique_lock lock(mutex_);
        store_.clear();
    }

    void ConsensusManager::log_phase(const Proposal &proposal) const
    {
        if (!proposal.result)
            return;
        const auto &r = *proposal.result;
        log_->info("proposal {} {}: {} agree, {} disagree of {} ({})",
                   proposal.id, phase_to_string(proposal.phase),
                   r.agree_count, r.disagree_count, r.total_voters, r.reason);
    }

    void ConsensusManager::broadcast(ConsensusMessage message)
    {
        if (!hooks_.broadcaster)
            return;

        if (hooks_.signer)
        {
            auto sig = hooks_.signer->sign(message.signing_bytes());
            if (!sig)
            {
                log_->warn("not broadcasting {} for {}: {}",
                           message_type_to_string(message.type), message.proposal_id, sig.error().what());
                return;
            }
            message.signature = std::move(*sig);
        }

        if (auto res = hooks_.broadcaster->broadcast(message); !res)
        {
            log_->warn("broadcast of {} for {} failed: {}",
                       message_type_to_string(message.type), message.proposal_id, res.error().what());
        }
    }

} // namespace agentnet
