#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentnet
{

    /**
     * One member's decision on one proposal. Never mutated once stored.
     */
    struct Vote
    {
        std::string voter_id;
        bool decision{false};
        std::string reason;
        TimePoint timestamp{};
        std::string signature; // base64, empty when no signer is configured

        nlohmann::json to_json() const;
        static Result<Vote> from_json(const nlohmann::json &j);
    };

    /**
     * Outcome attached to a proposal at the moment it becomes terminal
     */
    struct ConsensusResult
    {
        std::string proposal_id;
        bool passed{false};
        std::size_t agree_count{0};
        std::size_t disagree_count{0};
        std::size_t total_voters{0};
        double quorum_fraction{0.0};
        TimePoint finalized_at{};
        std::string reason;

        nlohmann::json to_json() const;
        static Result<ConsensusResult> from_json(const nlohmann::json &j);
    };

    struct Proposal
    {
        std::string id;
        ProposalType type{ProposalType::Join};
        nlohmann::json data; // opaque payload
        std::string proposer_id;
        TimePoint created_at{};
        TimePoint deadline{};
        Phase phase{Phase::Pending};
        std::map<std::string, Vote> votes; // voter_id -> vote
        std::optional<ConsensusResult> result;

        bool is_terminal() const { return agentnet::is_terminal(phase); }

        bool deadline_passed(TimePoint now) const { return now > deadline; }

        bool has_voted(std::string_view voter_id) const;

        std::size_t count_votes(bool decision) const;

        nlohmann::json to_json() const;
        static Result<Proposal> from_json(const nlohmann::json &j);
    };

    /**
     * Move a pending proposal into a terminal phase and attach its result,
     * computed from the votes recorded so far.
     */
    void conclude(Proposal &proposal,
                  Phase terminal,
                  bool passed,
                  std::string reason,
                  std::size_t total_voters,
                  double quorum_fraction,
                  TimePoint now);

    /** Payload of a JOIN proposal */
    struct JoinProposalData
    {
        std::string new_node_id;
        std::string new_node_pubkey;
        std::string sponsor_id;
        std::string guarantee_id;
        double initial_reputation{0.0};

        nlohmann::json to_json() const;
    };

    /** Payload of a KICK proposal */
    struct KickProposalData
    {
        std::string node_id;
        std::string reason;
        std::string evidence;
        std::string reporter_id;

        nlohmann::json to_json() const;
    };

    /**
     * Creates and indexes proposals, enforcing the cap on non-terminal ones.
     * Not synchronised; ConsensusManager serialises access.
     */
    class ProposalStore
    {
    public:
        ProposalStore(std::size_t max_pending, std::chrono::seconds voting_timeout);

        /**
         * Create a Pending proposal with a random 128-bit hex id and a deadline
         * voting_timeout after now. Fails with CapacityExceeded at the cap.
         */
        Result<Proposal> create(ProposalType type,
                                nlohmann::json data,
                                std::string proposer_id,
                                TimePoint now);

        /** Index a proposal received from another node (same cap; id must be new). */
        Result<void> import(Proposal proposal);

        Proposal *find(std::string_view id);
        const Proposal *find(std::string_view id) const;

        std::size_t pending_count() const;

        std::vector<Proposal> pending() const;

        std::size_t size() const { return proposals_.size(); }

        std::unordered_map<std::string, Proposal> &entries() { return proposals_; }

        void clear() { proposals_.clear(); }

    private:
        Result<void> check_capacity() const;

        std::size_t max_pending_;
        std::chrono::seconds voting_timeout_;
        std::unordered_map<std::string, Proposal> proposals_;
    };

} // namespace agentnet
