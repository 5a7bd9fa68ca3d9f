#pragma once

#include "clock.hpp"
#include "crypto.hpp"
#include "proposal.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace agentnet
{

    enum class MessageType
    {
        PrePrepare, // proposal announcement
        Prepare     // vote
    };

    std::string message_type_to_string(MessageType type);
    Result<MessageType> message_type_from_string(const std::string &s);

    /**
     * Message exchanged between committee members. The payload is the JSON
     * form of a Proposal (PRE_PREPARE) or a Vote (PREPARE).
     */
    struct ConsensusMessage
    {
        MessageType type{MessageType::PrePrepare};
        std::string proposal_id;
        std::uint64_t sequence{0};
        std::uint64_t view{0}; // committee rotation sequence of the sender
        std::string sender_id;
        TimePoint timestamp{};
        std::string signature;
        nlohmann::json payload;

        static ConsensusMessage pre_prepare(const Proposal &proposal,
                                            std::uint64_t sequence,
                                            std::uint64_t view,
                                            std::string sender_id,
                                            TimePoint now);

        static ConsensusMessage prepare(std::string proposal_id,
                                        std::uint64_t sequence,
                                        std::uint64_t view,
                                        std::string sender_id,
                                        const Vote &vote,
                                        TimePoint now);

        /** Decode the carried proposal; InvalidInput unless type is PRE_PREPARE */
        Result<Proposal> proposal() const;

        /** Decode the carried vote; InvalidInput unless type is PREPARE */
        Result<Vote> vote() const;

        /** Bytes covered by the message signature (every field but the signature) */
        crypto::Bytes signing_bytes() const;

        nlohmann::json to_json() const;
        static Result<ConsensusMessage> from_json(const nlohmann::json &j);

        /** Compact JSON; invalid UTF-8 in strings is replaced, never thrown on */
        std::string encode() const;
        static Result<ConsensusMessage> decode(const std::string &text);
    };

} // namespace agentnet
