#include "agentnet/signing.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace agentnet
{

    crypto::Bytes canonical_vote_bytes(std::string_view proposal_id, std::string_view voter_id, bool decision)
    {
        auto s = std::format("{}:{}:{}", proposal_id, voter_id, decision ? "true" : "false");
        return crypto::Bytes(s.begin(), s.end());
    }

    Ed25519Signer::Ed25519Signer(crypto::Ed25519KeyPair keypair)
        : keypair_(std::move(keypair))
    {
    }

    Result<std::string> Ed25519Signer::sign(const crypto::Bytes &data)
    {
        auto sig = keypair_.sign(data);
        return crypto::Base64::encode(crypto::Bytes(sig.begin(), sig.end()));
    }

    Result<std::shared_ptr<CommitteeKeyVerifier>> CommitteeKeyVerifier::from_members(
        const std::vector<CommitteeMember> &members)
    {
        auto verifier = std::make_shared<CommitteeKeyVerifier>();
        for (const auto &m : members)
        {
            if (m.public_key.empty())
                continue;
            if (auto res = verifier->add_key(m.node_id, m.public_key); !res)
                return std::unexpected(res.error());
        }
        return verifier;
    }

    Result<void> CommitteeKeyVerifier::add_key(std::string node_id, std::string public_key_b64)
    {
        auto decoded = crypto::Base64::decode(public_key_b64);
        if (!decoded)
            return std::unexpected(decoded.error());
        if (decoded->size() != 32)
        {
            return std::unexpected(ConsensusError::crypto(
                std::format("Invalid public key length for {} (expected 32 bytes)", node_id)));
        }

        crypto::Ed25519PublicKey pub{};
        std::copy(decoded->begin(), decoded->end(), pub.begin());

        std::unique_lock lock(mutex_);
        keys_.insert_or_assign(std::move(node_id), pub);
        return {};
    }

    void CommitteeKeyVerifier::remove_key(std::string_view node_id)
    {
        std::unique_lock lock(mutex_);
        keys_.erase(std::string(node_id));
    }

    bool CommitteeKeyVerifier::verify(std::string_view node_id,
                                      const crypto::Bytes &data,
                                      std::string_view signature) const
    {
        if (signature.empty())
            return false;

        crypto::Ed25519PublicKey pub{};
        {
            std::shared_lock lock(mutex_);
            auto it = keys_.find(std::string(node_id));
            if (it == keys_.end())
                return false;
            pub = it->second;
        }

        auto sig_bytes = crypto::Base64::decode(std::string(signature));
        if (!sig_bytes || sig_bytes->size() != 64)
            return false;

        crypto::Ed25519Signature sig{};
        std::copy(sig_bytes->begin(), sig_bytes->end(), sig.begin());
        return crypto::Ed25519KeyPair::verify(data, sig, pub);
    }

} // namespace agentnet
