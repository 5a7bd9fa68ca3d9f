#include "agentnet/message.hpp"
#include <format>

using json = nlohmann::json;

namespace agentnet
{
    namespace
    {
        // Reasons and proposal data are free text; bytes that are not UTF-8
        // become U+FFFD so that serialisation never throws.
        std::string dump_wire(const json &j)
        {
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }
    } // namespace

    std::string message_type_to_string(MessageType type)
    {
        switch (type)
        {
        case MessageType::PrePrepare:
            return "PRE_PREPARE";
        case MessageType::Prepare:
            return "PREPARE";
        }
        return "UNKNOWN";
    }

    Result<MessageType> message_type_from_string(const std::string &s)
    {
        if (s == "PRE_PREPARE")
            return MessageType::PrePrepare;
        if (s == "PREPARE")
            return MessageType::Prepare;
        return std::unexpected(ConsensusError::parsing(std::format("Unsupported message type: {}", s)));
    }

    ConsensusMessage ConsensusMessage::pre_prepare(const Proposal &proposal,
                                                   std::uint64_t sequence,
                                                   std::uint64_t view,
                                                   std::string sender_id,
                                                   TimePoint now)
    {
        return ConsensusMessage{MessageType::PrePrepare,
                                proposal.id,
                                sequence,
                                view,
                                std::move(sender_id),
                                now,
                                {},
                                proposal.to_json()};
    }

    ConsensusMessage ConsensusMessage::prepare(std::string proposal_id,
                                               std::uint64_t sequence,
                                               std::uint64_t view,
                                               std::string sender_id,
                                               const Vote &vote,
                                               TimePoint now)
    {
        return ConsensusMessage{MessageType::Prepare,
                                std::move(proposal_id),
                                sequence,
                                view,
                                std::move(sender_id),
                                now,
                                {},
                                vote.to_json()};
    }

    Result<Proposal> ConsensusMessage::proposal() const
    {
        if (type != MessageType::PrePrepare)
            return std::unexpected(ConsensusError::invalid_input("message does not carry a proposal"));
        auto p = Proposal::from_json(payload);
        if (!p)
            return std::unexpected(p.error());
        if (p->id != proposal_id)
            return std::unexpected(ConsensusError::invalid_input("payload proposal id does not match message"));
        return p;
    }

    Result<Vote> ConsensusMessage::vote() const
    {
        if (type != MessageType::Prepare)
            return std::unexpected(ConsensusError::invalid_input("message does not carry a vote"));
        return Vote::from_json(payload);
    }

    crypto::Bytes ConsensusMessage::signing_bytes() const
    {
        auto j = to_json();
        j.erase("signature");
        auto text = dump_wire(j);
        return crypto::Bytes(text.begin(), text.end());
    }

    std::string ConsensusMessage::encode() const
    {
        return dump_wire(to_json());
    }

    nlohmann::json ConsensusMessage::to_json() const
    {
        return json{{"type", message_type_to_string(type)},
                    {"proposal_id", proposal_id},
                    {"sequence", sequence},
                    {"view", view},
                    {"sender_id", sender_id},
                    {"timestamp", to_unix_seconds(timestamp)},
                    {"signature", signature},
                    {"payload", payload}};
    }

    Result<ConsensusMessage> ConsensusMessage::from_json(const nlohmann::json &j)
    {
        try
        {
            ConsensusMessage m;
            auto type = message_type_from_string(j.at("type").get<std::string>());
            if (!type)
                return std::unexpected(type.error());
            m.type = *type;
            m.proposal_id = j.at("proposal_id").get<std::string>();
            m.sequence = j.value("sequence", std::uint64_t{0});
            m.view = j.value("view", std::uint64_t{0});
            m.sender_id = j.at("sender_id").get<std::string>();
            m.timestamp = from_unix_seconds(j.value("timestamp", std::int64_t{0}));
            m.signature = j.value("signature", "");
            m.payload = j.value("payload", json());
            return m;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(ConsensusError::parsing(std::format("Failed to parse message: {}", e.what())));
        }
    }

    Result<ConsensusMessage> ConsensusMessage::decode(const std::string &text)
    {
        try
        {
            return from_json(json::parse(text));
        }
        catch (const json::exception &e)
        {
            return std::unexpected(ConsensusError::parsing(std::format("JSON parse error: {}", e.what())));
        }
    }

} // namespace agentnet
