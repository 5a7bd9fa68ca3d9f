#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentnet
{

    struct CommitteeMember
    {
        std::string node_id;
        std::string public_key; // base64 Ed25519 public key
        double reputation{0.0};
        TimePoint joined_at{};
        bool is_leader{false};

        nlohmann::json to_json() const;
    };

    /**
     * Ordered set of empowered voters. When members is non-empty exactly the
     * member at leader_index carries is_leader.
     */
    struct Committee
    {
        std::vector<CommitteeMember> members;
        std::size_t leader_index{0};
        std::uint64_t rotation_sequence{0};
        TimePoint updated_at{};

        std::size_t size() const { return members.size(); }

        bool is_member(std::string_view node_id) const;

        const CommitteeMember *find(std::string_view node_id) const;

        /** Current leader, or none when leader_index is out of range */
        std::optional<CommitteeMember> leader() const;

        /** max(1, floor(size * fraction)) */
        std::size_t quorum_size(double fraction) const;

        nlohmann::json to_json() const;
    };

    /** max(1, floor(committee_size * fraction)) */
    std::size_t quorum_size_for(std::size_t committee_size, double fraction);

    /**
     * Owns the local view of the committee and performs leader rotation.
     * Not synchronised; ConsensusManager serialises access.
     */
    class CommitteeManager
    {
    public:
        explicit CommitteeManager(double quorum_fraction);

        /**
         * Replace the committee wholesale; member 0 becomes leader.
         * InvalidInput, with the old committee kept, on an empty or repeated node id.
         */
        Result<void> set_committee(std::vector<CommitteeMember> members, TimePoint now);

        /** Advance leadership to the next member with wrap-around. No-op when empty. */
        void rotate_leader(TimePoint now);

        bool is_member(std::string_view node_id) const { return committee_.is_member(node_id); }

        std::optional<CommitteeMember> leader() const { return committee_.leader(); }

        std::size_t quorum_size() const { return committee_.quorum_size(quorum_fraction_); }

        std::size_t size() const { return committee_.size(); }

        double quorum_fraction() const { return quorum_fraction_; }

        const Committee &committee() const { return committee_; }

    private:
        Committee committee_;
        double quorum_fraction_;
    };

} // namespace agentnet
