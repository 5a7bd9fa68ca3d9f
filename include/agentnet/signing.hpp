#pragma once

#include "committee.hpp"
#include "crypto.hpp"
#include "hooks.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentnet
{

    /** Canonical bytes a vote signature covers: "<proposal_id>:<voter_id>:<true|false>" */
    crypto::Bytes canonical_vote_bytes(std::string_view proposal_id, std::string_view voter_id, bool decision);

    /**
     * Signer backed by the local node's Ed25519 key pair; emits base64 signatures.
     */
    class Ed25519Signer : public Signer
    {
    public:
        explicit Ed25519Signer(crypto::Ed25519KeyPair keypair);

        Result<std::string> sign(const crypto::Bytes &data) override;

        std::string public_key_b64() const { return keypair_.public_key_b64(); }

    private:
        crypto::Ed25519KeyPair keypair_;
    };

    /**
     * Verifier holding the base64 Ed25519 public key of each known node.
     * Unknown nodes, empty or malformed signatures never verify.
     */
    class CommitteeKeyVerifier : public Verifier
    {
    public:
        CommitteeKeyVerifier() = default;

        /** Register keys for every member of a committee */
        static Result<std::shared_ptr<CommitteeKeyVerifier>> from_members(const std::vector<CommitteeMember> &members);

        Result<void> add_key(std::string node_id, std::string public_key_b64);

        void remove_key(std::string_view node_id);

        bool verify(std::string_view node_id,
                    const crypto::Bytes &data,
                    std::string_view signature) const override;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, crypto::Ed25519PublicKey> keys_;
    };

} // namespace agentnet
