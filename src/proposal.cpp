#include "agentnet/proposal.hpp"
#include "agentnet/crypto.hpp"
#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace agentnet
{

    nlohmann::json Vote::to_json() const
    {
        return json{{"voter_id", voter_id},
                    {"vote", decision},
                    {"reason", reason},
                    {"timestamp", to_unix_seconds(timestamp)},
                    {"signature", signature}};
    }

    Result<Vote> Vote::from_json(const nlohmann::json &j)
    {
        try
        {
            Vote v;
            v.voter_id = j.at("voter_id").get<std::string>();
            v.decision = j.at("vote").get<bool>();
            v.reason = j.value("reason", "");
            v.timestamp = from_unix_seconds(j.value("timestamp", std::int64_t{0}));
            v.signature = j.value("signature", "");
            return v;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(ConsensusError::parsing(std::format("Failed to parse vote: {}", e.what())));
        }
    }

    nlohmann::json ConsensusResult::to_json() const
    {
        return json{{"proposal_id", proposal_id},
                    {"passed", passed},
                    {"agree_count", agree_count},
                    {"disagree_count", disagree_count},
                    {"total_voters", total_voters},
                    {"quorum", quorum_fraction},
                    {"finalized_at", to_unix_seconds(finalized_at)},
                    {"reason", reason}};
    }

    Result<ConsensusResult> ConsensusResult::from_json(const nlohmann::json &j)
    {
        try
        {
            ConsensusResult r;
            r.proposal_id = j.at("proposal_id").get<std::string>();
            r.passed = j.at("passed").get<bool>();
            r.agree_count = j.value("agree_count", std::size_t{0});
            r.disagree_count = j.value("disagree_count", std::size_t{0});
            r.total_voters = j.value("total_voters", std::size_t{0});
            r.quorum_fraction = j.value("quorum", 0.0);
            r.finalized_at = from_unix_seconds(j.value("finalized_at", std::int64_t{0}));
            r.reason = j.value("reason", "");
            return r;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(ConsensusError::parsing(std::format("Failed to parse result: {}", e.what())));
        }
    }

    bool Proposal::has_voted(std::string_view voter_id) const
    {
        return votes.contains(std::string(voter_id));
    }

    std::size_t Proposal::count_votes(bool decision) const
    {
        return static_cast<std::size_t>(std::count_if(votes.begin(), votes.end(),
                                                      [decision](const auto &kv) { return kv.second.decision == decision; }));
    }

    nlohmann::json Proposal::to_json() const
    {
        json vote_map = json::object();
        for (const auto &[voter, v] : votes)
            vote_map[voter] = v.to_json();

        json j{{"id", id},
               {"type", proposal_type_to_string(type)},
               {"data", data},
               {"proposer_id", proposer_id},
               {"created_at", to_unix_seconds(created_at)},
               {"deadline", to_unix_seconds(deadline)},
               {"phase", phase_to_string(phase)},
               {"votes", vote_map}};
        if (result)
            j["result"] = result->to_json();
        return j;
    }

    Result<Proposal> Proposal::from_json(const nlohmann::json &j)
    {
        try
        {
            Proposal p;
            p.id = j.at("id").get<std::string>();

            auto type = proposal_type_from_string(j.at("type").get<std::string>());
            if (!type)
                return std::unexpected(ConsensusError::parsing(type.error()));
            p.type = *type;

            auto phase = phase_from_string(j.value("phase", "PENDING"));
            if (!phase)
                return std::unexpected(ConsensusError::parsing(phase.error()));
            p.phase = *phase;

            p.data = j.value("data", json());
            p.proposer_id = j.value("proposer_id", "");
            p.created_at = from_unix_seconds(j.at("created_at").get<std::int64_t>());
            p.deadline = from_unix_seconds(j.at("deadline").get<std::int64_t>());

            if (auto it = j.find("votes"); it != j.end() && it->is_object())
            {
                for (const auto &[voter, vj] : it->items())
                {
                    auto v = Vote::from_json(vj);
                    if (!v)
                        return std::unexpected(v.error());
                    p.votes.emplace(voter, std::move(*v));
                }
            }

            if (auto it = j.find("result"); it != j.end() && !it->is_null())
            {
                auto r = ConsensusResult::from_json(*it);
                if (!r)
                    return std::unexpected(r.error());
                p.result = std::move(*r);
            }
            return p;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(ConsensusError::parsing(std::format("Failed to parse proposal: {}", e.what())));
        }
    }

    void conclude(Proposal &proposal,
                  Phase terminal,
                  bool passed,
                  std::string reason,
                  std::size_t total_voters,
                  double quorum_fraction,
                  TimePoint now)
    {
        proposal.phase = terminal;
        proposal.result = ConsensusResult{
            proposal.id,
            passed,
            proposal.count_votes(true),
            proposal.count_votes(false),
            total_voters,
            quorum_fraction,
            now,
            std::move(reason)};
    }

    nlohmann::json JoinProposalData::to_json() const
    {
        return json{{"new_node_id", new_node_id},
                    {"new_node_pubkey", new_node_pubkey},
                    {"sponsor_id", sponsor_id},
                    {"guarantee_id", guarantee_id},
                    {"initial_rep", initial_reputation}};
    }

    nlohmann::json KickProposalData::to_json() const
    {
        return json{{"node_id", node_id},
                    {"reason", reason},
                    {"evidence", evidence},
                    {"reporter_id", reporter_id}};
    }

    // ============================================================================
    // ProposalStore
    // ============================================================================

    ProposalStore::ProposalStore(std::size_t max_pending, std::chrono::seconds voting_timeout)
        : max_pending_(max_pending), voting_timeout_(voting_timeout)
    {
    }

    Result<void> ProposalStore::check_capacity() const
    {
        auto pending = pending_count();
        if (pending >= max_pending_)
        {
            return std::unexpected(ConsensusError::capacity(
                std::format("too many pending proposals ({})", pending)));
        }
        return {};
    }

    Result<Proposal> ProposalStore::create(ProposalType type,
                                           nlohmann::json data,
                                           std::string proposer_id,
                                           TimePoint now)
    {
        if (auto cap = check_capacity(); !cap)
            return std::unexpected(cap.error());

        Proposal proposal;
        proposal.id = crypto::SecureRandom::random_id();
        proposal.type = type;
        proposal.data = std::move(data);
        proposal.proposer_id = std::move(proposer_id);
        proposal.created_at = now;
        proposal.deadline = now + voting_timeout_;
        proposal.phase = Phase::Pending;

        auto [it, _] = proposals_.emplace(proposal.id, std::move(proposal));
        return it->second;
    }

    Result<void> ProposalStore::import(Proposal proposal)
    {
        if (proposal.id.empty())
            return std::unexpected(ConsensusError::invalid_input("proposal id is empty"));
        if (proposals_.contains(proposal.id))
            return std::unexpected(ConsensusError::invalid_input(
                std::format("proposal already known: {}", proposal.id)));
        if (auto cap = check_capacity(); !cap)
            return cap;

        proposal.phase = Phase::Pending;
        proposal.votes.clear();
        proposal.result.reset();
        auto id = proposal.id;
        proposals_.emplace(std::move(id), std::move(proposal));
        return {};
    }

    Proposal *ProposalStore::find(std::string_view id)
    {
        auto it = proposals_.find(std::string(id));
        if (it == proposals_.end())
            return nullptr;
        return &it->second;
    }

    const Proposal *ProposalStore::find(std::string_view id) const
    {
        auto it = proposals_.find(std::string(id));
        if (it == proposals_.end())
            return nullptr;
        return &it->second;
    }

    std::size_t ProposalStore::pending_count() const
    {
        return static_cast<std::size_t>(std::count_if(proposals_.begin(), proposals_.end(),
                                                      [](const auto &kv) { return !kv.second.is_terminal(); }));
    }

    std::vector<Proposal> ProposalStore::pending() const
    {
        std::vector<Proposal> out;
        for (const auto &[_, p] : proposals_)
        {
            if (!p.is_terminal())
                out.push_back(p);
        }
        return out;
    }

} // namespace agentnet
