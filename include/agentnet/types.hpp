#pragma once

#include <expected>
#include <format>
#include <stdexcept>
#include <string>

namespace agentnet
{

    /**
     * Kind of decision a committee votes on
     */
    enum class ProposalType
    {
        Join,
        Kick,
        Suspend,
        Parameter,
        Emergency
    };

    /**
     * Lifecycle position of a proposal. Everything except Pending is terminal.
     */
    enum class Phase
    {
        Pending,
        Finalized,
        Rejected,
        Timeout
    };

    inline std::string proposal_type_to_string(ProposalType type)
    {
        switch (type)
        {
        case ProposalType::Join:
            return "JOIN";
        case ProposalType::Kick:
            return "KICK";
        case ProposalType::Suspend:
            return "SUSPEND";
        case ProposalType::Parameter:
            return "PARAMETER";
        case ProposalType::Emergency:
            return "EMERGENCY";
        }
        return "UNKNOWN";
    }

    inline std::expected<ProposalType, std::string> proposal_type_from_string(const std::string &s)
    {
        if (s == "JOIN")
            return ProposalType::Join;
        if (s == "KICK")
            return ProposalType::Kick;
        if (s == "SUSPEND")
            return ProposalType::Suspend;
        if (s == "PARAMETER")
            return ProposalType::Parameter;
        if (s == "EMERGENCY")
            return ProposalType::Emergency;
        return std::unexpected(std::format("Invalid proposal type: {}", s));
    }

    inline std::string phase_to_string(Phase phase)
    {
        switch (phase)
        {
        case Phase::Pending:
            return "PENDING";
        case Phase::Finalized:
            return "FINALIZED";
        case Phase::Rejected:
            return "REJECTED";
        case Phase::Timeout:
            return "TIMEOUT";
        }
        return "UNKNOWN";
    }

    inline std::expected<Phase, std::string> phase_from_string(const std::string &s)
    {
        if (s == "PENDING")
            return Phase::Pending;
        if (s == "FINALIZED")
            return Phase::Finalized;
        if (s == "REJECTED")
            return Phase::Rejected;
        if (s == "TIMEOUT")
            return Phase::Timeout;
        return std::unexpected(std::format("Invalid phase: {}", s));
    }

    inline bool is_terminal(Phase phase)
    {
        return phase == Phase::Finalized || phase == Phase::Rejected || phase == Phase::Timeout;
    }

    /**
     * Error conditions reported by the consensus core
     */
    enum class ErrorCode
    {
        NotMember,
        NotFound,
        DuplicateVote,
        DeadlinePassed,
        CapacityExceeded,
        SigningFailed,
        InvalidSignature,
        InvalidInput,
        ProposalClosed,
        ConfigError,
        ParsingError,
        CryptoError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Consensus error with code and message
     */
    class ConsensusError : public std::runtime_error
    {
    public:
        ErrorCode code;

        ConsensusError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static ConsensusError not_member(const std::string &msg)
        {
            return ConsensusError(ErrorCode::NotMember, msg);
        }

        static ConsensusError not_found(const std::string &msg)
        {
            return ConsensusError(ErrorCode::NotFound, msg);
        }

        static ConsensusError duplicate_vote(const std::string &msg)
        {
            return ConsensusError(ErrorCode::DuplicateVote, msg);
        }

        static ConsensusError deadline_passed(const std::string &msg)
        {
            return ConsensusError(ErrorCode::DeadlinePassed, msg);
        }

        static ConsensusError capacity(const std::string &msg)
        {
            return ConsensusError(ErrorCode::CapacityExceeded, msg);
        }

        static ConsensusError signing(const std::string &msg)
        {
            return ConsensusError(ErrorCode::SigningFailed, msg);
        }

        static ConsensusError invalid_signature(const std::string &msg)
        {
            return ConsensusError(ErrorCode::InvalidSignature, msg);
        }

        static ConsensusError invalid_input(const std::string &msg)
        {
            return ConsensusError(ErrorCode::InvalidInput, msg);
        }

        static ConsensusError closed(const std::string &msg)
        {
            return ConsensusError(ErrorCode::ProposalClosed, msg);
        }

        static ConsensusError config(const std::string &msg)
        {
            return ConsensusError(ErrorCode::ConfigError, msg);
        }

        static ConsensusError parsing(const std::string &msg)
        {
            return ConsensusError(ErrorCode::ParsingError, msg);
        }

        static ConsensusError crypto(const std::string &msg)
        {
            return ConsensusError(ErrorCode::CryptoError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ConsensusError>;

} // namespace agentnet
