#include "agentnet/committee.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_set>

namespace agentnet
{

    nlohmann::json CommitteeMember::to_json() const
    {
        return nlohmann::json{{"node_id", node_id},
                              {"pubkey", public_key},
                              {"reputation", reputation},
                              {"joined_at", to_unix_seconds(joined_at)},
                              {"is_leader", is_leader}};
    }

    bool Committee::is_member(std::string_view node_id) const
    {
        return find(node_id) != nullptr;
    }

    const CommitteeMember *Committee::find(std::string_view node_id) const
    {
        auto it = std::find_if(members.begin(), members.end(),
                               [&](const CommitteeMember &m) { return m.node_id == node_id; });
        if (it == members.end())
            return nullptr;
        return &*it;
    }

    std::optional<CommitteeMember> Committee::leader() const
    {
        if (members.empty() || leader_index >= members.size())
            return std::nullopt;
        return members[leader_index];
    }

    std::size_t Committee::quorum_size(double fraction) const
    {
        return quorum_size_for(members.size(), fraction);
    }

    nlohmann::json Committee::to_json() const
    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &m : members)
            list.push_back(m.to_json());
        return nlohmann::json{{"members", list},
                              {"leader_index", leader_index},
                              {"rotation_seq", rotation_sequence},
                              {"updated_at", to_unix_seconds(updated_at)}};
    }

    std::size_t quorum_size_for(std::size_t committee_size, double fraction)
    {
        // Floor, not ceiling: size 3 needs 2 agreeing votes.
        auto quorum = static_cast<std::size_t>(std::floor(static_cast<double>(committee_size) * fraction));
        return std::max<std::size_t>(1, quorum);
    }

    CommitteeManager::CommitteeManager(double quorum_fraction)
        : quorum_fraction_(quorum_fraction)
    {
    }

    Result<void> CommitteeManager::set_committee(std::vector<CommitteeMember> members, TimePoint now)
    {
        std::unordered_set<std::string_view> seen;
        for (const auto &m : members)
        {
            if (m.node_id.empty())
                return std::unexpected(ConsensusError::invalid_input("committee member with empty node id"));
            if (!seen.insert(m.node_id).second)
            {
                return std::unexpected(ConsensusError::invalid_input(
                    std::format("node {} listed more than once in committee", m.node_id)));
            }
        }

        for (auto &m : members)
            m.is_leader = false;
        if (!members.empty())
            members.front().is_leader = true;

        committee_ = Committee{std::move(members), 0, 0, now};
        return {};
    }

    void CommitteeManager::rotate_leader(TimePoint now)
    {
        auto &members = committee_.members;
        if (members.empty())
            return;

        if (committee_.leader_index < members.size())
            members[committee_.leader_index].is_leader = false;

        committee_.leader_index = (committee_.leader_index + 1) % members.size();
        members[committee_.leader_index].is_leader = true;
        ++committee_.rotation_sequence;
        committee_.updated_at = now;
    }

} // namespace agentnet
