#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace agentnet
{

    struct CommitteeConfig
    {
        std::size_t min_size{4};
        std::size_t default_size{5};
        std::size_t max_size{11};
        std::uint64_t rotation_interval{100}; // host events between leader rotations
    };

    struct VotingConfig
    {
        double quorum_fraction{0.67};
        std::chrono::seconds voting_timeout{30};
        std::size_t max_pending{100};
    };

    struct RetentionConfig
    {
        std::chrono::seconds max_age{3600};
        std::chrono::seconds sweep_interval{5};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v"};
    };

    struct ConsensusConfig
    {
        CommitteeConfig committee{};
        VotingConfig voting{};
        RetentionConfig retention{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     *
     * Recognised tables: [committee], [voting], [retention], [logging].
     * Environment variables prefixed AGENTNET_ take precedence over file values.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<ConsensusConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<ConsensusConfig> from_string(const std::string &toml_content);

        /** Check cross-field constraints (size bounds, quorum fraction range, non-zero limits). */
        static Result<void> validate(const ConsensusConfig &cfg);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const ConsensusConfig &cfg);

    private:
        static Result<void> apply_env_overrides(ConsensusConfig &cfg);
    };

} // namespace agentnet
