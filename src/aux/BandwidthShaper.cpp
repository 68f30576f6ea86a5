#include "aux/BandwidthShaper.hpp"

BandwidthShaper::BandwidthShaper()
    : BandwidthShaper(Clock::now())
{
}

BandwidthShaper::BandwidthShaper(Clock::time_point now)
    : _windowStart(now)
{
}

std::chrono::milliseconds BandwidthShaper::consume(std::uint64_t bytes, std::int64_t limitBps)
{
    return consume(bytes, limitBps, Clock::now());
}

// Adds bytes to the current window and returns the delay that keeps the window at or under the limit
std::chrono::milliseconds BandwidthShaper::consume(std::uint64_t bytes, std::int64_t limitBps, Clock::time_point now)
{
    if (limitBps <= 0)
    {
        // Unlimited; keep the window fresh in case a limit is set later
        _windowStart = now;
        _bytesInWindow = 0;
        return std::chrono::milliseconds(0);
    }

    double elapsed = std::chrono::duration<double>(now - _windowStart).count();
    if (elapsed >= 1.0)
    {
        _windowStart = now;
        _bytesInWindow = 0;
        elapsed = 0.0;
    }

    _bytesInWindow += bytes;

    // Time the window's bytes should have taken at the allowed rate
    double expected = static_cast<double>(_bytesInWindow) / static_cast<double>(limitBps);
    if (expected <= elapsed)
    {
        return std::chrono::milliseconds(0);
    }

    return std::chrono::milliseconds(static_cast<long long>((expected - elapsed) * 1000.0 + 0.5));
}
