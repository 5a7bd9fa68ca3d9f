#include "agentnet/config.hpp"
#include <toml++/toml.h>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace agentnet
{
    namespace
    {
        // Counts and sizes are unsigned in the config structs; a negative
        // TOML integer would wrap on the cast.
        template <typename T>
        Result<void> read_count(const toml::table &tbl, std::string_view section, std::string_view key, T &out)
        {
            auto v = tbl[key].value<int64_t>();
            if (!v)
                return {};
            if (*v < 0)
                return std::unexpected(ConsensusError::config(std::format("{}.{} must not be negative ({})", section, key, *v)));
            out = static_cast<T>(*v);
            return {};
        }

        Result<ConsensusConfig> parse_toml(const toml::table &tbl, ConsensusConfig cfg)
        {
            if (auto committee = tbl["committee"].as_table())
            {
                if (auto res = read_count(*committee, "committee", "min_size", cfg.committee.min_size); !res)
                    return std::unexpected(res.error());
                if (auto res = read_count(*committee, "committee", "default_size", cfg.committee.default_size); !res)
                    return std::unexpected(res.error());
                if (auto res = read_count(*committee, "committee", "max_size", cfg.committee.max_size); !res)
                    return std::unexpected(res.error());
                if (auto res = read_count(*committee, "committee", "rotation_interval", cfg.committee.rotation_interval); !res)
                    return std::unexpected(res.error());
            }

            if (auto voting = tbl["voting"].as_table())
            {
                if (auto v = (*voting)["quorum_fraction"].value<double>())
                    cfg.voting.quorum_fraction = *v;
                if (auto v = (*voting)["timeout_secs"].value<int64_t>())
                    cfg.voting.voting_timeout = std::chrono::seconds(*v);
                if (auto res = read_count(*voting, "voting", "max_pending", cfg.voting.max_pending); !res)
                    return std::unexpected(res.error());
            }

            if (auto retention = tbl["retention"].as_table())
            {
                if (auto v = (*retention)["max_age_secs"].value<int64_t>())
                    cfg.retention.max_age = std::chrono::seconds(*v);
                if (auto v = (*retention)["sweep_interval_secs"].value<int64_t>())
                    cfg.retention.sweep_interval = std::chrono::seconds(*v);
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto v = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *v;
                if (auto v = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *v;
            }

            return cfg;
        }

        template <typename T>
        Result<T> env_number(const char *name, const char *value)
        {
            const std::string text(value);
            const auto invalid = [&] {
                return std::unexpected(ConsensusError::config(std::format("Invalid value for {}: {}", name, text)));
            };
            if constexpr (std::is_unsigned_v<T>)
            {
                if (text.find('-') != std::string::npos)
                    return invalid();
            }

            try
            {
                std::size_t used = 0;
                T parsed{};
                if constexpr (std::is_floating_point_v<T>)
                    parsed = static_cast<T>(std::stod(text, &used));
                else if constexpr (std::is_signed_v<T>)
                    parsed = static_cast<T>(std::stoll(text, &used));
                else
                    parsed = static_cast<T>(std::stoull(text, &used));
                if (used != text.size())
                    return invalid();
                return parsed;
            }
            catch (const std::exception &)
            {
                return invalid();
            }
        }
    } // namespace

    Result<ConsensusConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ConsensusError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<ConsensusConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        ConsensusConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = *parsed;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConsensusError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        if (auto res = validate(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<void> ConfigLoader::validate(const ConsensusConfig &cfg)
    {
        const auto &c = cfg.committee;
        if (c.min_size > c.max_size)
        {
            return std::unexpected(ConsensusError::config(
                std::format("committee.min_size ({}) exceeds committee.max_size ({})", c.min_size, c.max_size)));
        }
        if (c.default_size < c.min_size || c.default_size > c.max_size)
        {
            return std::unexpected(ConsensusError::config(
                std::format("committee.default_size ({}) outside [{}, {}]", c.default_size, c.min_size, c.max_size)));
        }
        if (c.rotation_interval == 0)
            return std::unexpected(ConsensusError::config("committee.rotation_interval must be positive"));

        if (!(cfg.voting.quorum_fraction > 0.0 && cfg.voting.quorum_fraction <= 1.0))
        {
            return std::unexpected(ConsensusError::config(
                std::format("voting.quorum_fraction ({}) must be in (0, 1]", cfg.voting.quorum_fraction)));
        }
        if (cfg.voting.voting_timeout.count() <= 0)
            return std::unexpected(ConsensusError::config("voting.timeout_secs must be positive"));
        if (cfg.voting.max_pending == 0)
            return std::unexpected(ConsensusError::config("voting.max_pending must be positive"));

        if (cfg.retention.max_age.count() < 0)
            return std::unexpected(ConsensusError::config("retention.max_age_secs must not be negative"));
        if (cfg.retention.sweep_interval.count() <= 0)
            return std::unexpected(ConsensusError::config("retention.sweep_interval_secs must be positive"));

        return {};
    }

    Result<void> ConfigLoader::apply_env_overrides(ConsensusConfig &cfg)
    {
        if (const char *v = std::getenv("AGENTNET_QUORUM_FRACTION"))
        {
            auto n = env_number<double>("AGENTNET_QUORUM_FRACTION", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.voting.quorum_fraction = *n;
        }
        if (const char *v = std::getenv("AGENTNET_VOTING_TIMEOUT_SECS"))
        {
            auto n = env_number<std::int64_t>("AGENTNET_VOTING_TIMEOUT_SECS", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.voting.voting_timeout = std::chrono::seconds(*n);
        }
        if (const char *v = std::getenv("AGENTNET_MAX_PENDING"))
        {
            auto n = env_number<std::size_t>("AGENTNET_MAX_PENDING", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.voting.max_pending = *n;
        }
        if (const char *v = std::getenv("AGENTNET_COMMITTEE_MIN"))
        {
            auto n = env_number<std::size_t>("AGENTNET_COMMITTEE_MIN", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.committee.min_size = *n;
        }
        if (const char *v = std::getenv("AGENTNET_COMMITTEE_MAX"))
        {
            auto n = env_number<std::size_t>("AGENTNET_COMMITTEE_MAX", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.committee.max_size = *n;
        }
        if (const char *v = std::getenv("AGENTNET_ROTATION_INTERVAL"))
        {
            auto n = env_number<std::uint64_t>("AGENTNET_ROTATION_INTERVAL", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.committee.rotation_interval = *n;
        }
        if (const char *v = std::getenv("AGENTNET_RETENTION_SECS"))
        {
            auto n = env_number<std::int64_t>("AGENTNET_RETENTION_SECS", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.retention.max_age = std::chrono::seconds(*n);
        }
        if (const char *v = std::getenv("AGENTNET_LOG_LEVEL"))
            cfg.logging.level = v;

        return {};
    }

    nlohmann::json ConfigLoader::to_json(const ConsensusConfig &cfg)
    {
        nlohmann::json j;
        j["committee"] = {
            {"min_size", cfg.committee.min_size},
            {"default_size", cfg.committee.default_size},
            {"max_size", cfg.committee.max_size},
            {"rotation_interval", cfg.committee.rotation_interval}};
        j["voting"] = {
            {"quorum_fraction", cfg.voting.quorum_fraction},
            {"timeout_secs", cfg.voting.voting_timeout.count()},
            {"max_pending", cfg.voting.max_pending}};
        j["retention"] = {
            {"max_age_secs", cfg.retention.max_age.count()},
            {"sweep_interval_secs", cfg.retention.sweep_interval.count()}};
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        return j;
    }

} // namespace agentnet
