#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace agentnet::logging
{
    /** Name of the logger shared by the consensus core */
    inline constexpr const char *kLoggerName = "agentnet";

    /**
     * Install (or reconfigure) the "agentnet" logger with the given level and pattern.
     * Unknown level names fall back to info.
     */
    std::shared_ptr<spdlog::logger> init(const LoggingConfig &cfg);

    /** The "agentnet" logger; created with defaults on first use if init() was never called. */
    std::shared_ptr<spdlog::logger> get();

} // namespace agentnet::logging
