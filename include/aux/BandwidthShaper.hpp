#ifndef BANDWIDTHSHAPER_HPP
#define BANDWIDTHSHAPER_HPP

#include <chrono>
#include <cstdint>

// One-second token bucket: tells the caller how long to sleep so a window never exceeds the limit
class BandwidthShaper
{
public:
    using Clock = std::chrono::steady_clock;

    BandwidthShaper();
    explicit BandwidthShaper(Clock::time_point now);

    std::chrono::milliseconds consume(std::uint64_t bytes, std::int64_t limitBps);
    std::chrono::milliseconds consume(std::uint64_t bytes, std::int64_t limitBps, Clock::time_point now);

private:
    Clock::time_point _windowStart;
    std::uint64_t _bytesInWindow{0};
};

#endif
