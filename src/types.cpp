#include "agentnet/types.hpp"

namespace agentnet
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotMember:
            return "not_member";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::DuplicateVote:
            return "duplicate_vote";
        case ErrorCode::DeadlinePassed:
            return "deadline_passed";
        case ErrorCode::CapacityExceeded:
            return "capacity_exceeded";
        case ErrorCode::SigningFailed:
            return "signing_failed";
        case ErrorCode::InvalidSignature:
            return "invalid_signature";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::ProposalClosed:
            return "proposal_closed";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        }
        return "unknown";
    }

} // namespace agentnet
