#pragma once

#include <chrono>
#include <cstdint>

namespace agentnet
{
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * Wall-clock source for every timestamp the consensus core records.
     * Injected so deadline and retention behaviour can be driven in tests.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual TimePoint now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        TimePoint now() const override
        {
            return std::chrono::system_clock::now();
        }
    };

    /** Seconds since the Unix epoch, the unit used on the wire */
    inline std::int64_t to_unix_seconds(TimePoint tp)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    inline TimePoint from_unix_seconds(std::int64_t secs)
    {
        return TimePoint{std::chrono::seconds(secs)};
    }

} // namespace agentnet
