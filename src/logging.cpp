#include "agentnet/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace agentnet::logging
{
    namespace
    {
        std::mutex &init_mutex()
        {
            static std::mutex m;
            return m;
        }

        std::shared_ptr<spdlog::logger> get_or_create()
        {
            if (auto existing = spdlog::get(kLoggerName))
                return existing;
            return spdlog::stdout_color_mt(kLoggerName);
        }
    } // namespace

    std::shared_ptr<spdlog::logger> init(const LoggingConfig &cfg)
    {
        std::lock_guard lock(init_mutex());
        auto logger = get_or_create();

        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
            level = spdlog::level::info;
        logger->set_level(level);
        logger->set_pattern(cfg.pattern);
        return logger;
    }

    std::shared_ptr<spdlog::logger> get()
    {
        if (auto existing = spdlog::get(kLoggerName))
            return existing;
        std::lock_guard lock(init_mutex());
        return get_or_create();
    }

} // namespace agentnet::logging
