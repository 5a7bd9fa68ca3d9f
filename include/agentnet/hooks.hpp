#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace agentnet
{
    struct ConsensusMessage;

    /** Signs bytes on behalf of the local node */
    class Signer
    {
    public:
        virtual ~Signer() = default;

        virtual Result<std::string> sign(const crypto::Bytes &data) = 0;
    };

    /** Checks a signature produced by another node */
    class Verifier
    {
    public:
        virtual ~Verifier() = default;

        virtual bool verify(std::string_view node_id,
                            const crypto::Bytes &data,
                            std::string_view signature) const = 0;
    };

    /** Delivers a consensus message to the other committee members */
    class Broadcaster
    {
    public:
        virtual ~Broadcaster() = default;

        virtual Result<void> broadcast(const ConsensusMessage &message) = 0;
    };

    /** Reputation score lookup; not consulted by quorum arithmetic */
    class ReputationSource
    {
    public:
        virtual ~ReputationSource() = default;

        virtual double reputation(std::string_view node_id) const = 0;
    };

    /**
     * Capabilities supplied by the host at construction. Any of them may be null.
     */
    struct ConsensusHooks
    {
        std::shared_ptr<Signer> signer;
        std::shared_ptr<Verifier> verifier;
        std::shared_ptr<Broadcaster> broadcaster;
        std::shared_ptr<ReputationSource> reputation;
    };

} // namespace agentnet
