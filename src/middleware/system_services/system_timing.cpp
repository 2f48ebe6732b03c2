// src/middleware/system_services/system_timing.cpp

#include "system_services/system_timing.hpp"

namespace Middleware {
namespace SystemServices {
// Static instance for singleton pattern
SystemTiming& SystemTiming::GetInstance() {

    static SystemTiming instance;
    return instance;
}

// Constructor
SystemTiming::SystemTiming()
    : tick_source(nullptr),
      tick_rate_hz(1000),
      tick_high(0),
      last_tick(0) {
}

Platform::Status SystemTiming::SetTickSource(TickSource source, uint32_t rate_hz) {
    if (source != nullptr && rate_hz == 0) {
        return Platform::Status::INVALID_PARAM;
    }

    tick_source = source;
    tick_rate_hz = (source != nullptr) ? rate_hz : 1000;

    // Restart the extended count from the new source
    tick_high.store(0);
    last_tick.store(source != nullptr ? source() : 0);

    return Platform::Status::OK;
}

uint64_t SystemTiming::GetTicks() {
    if (tick_source == nullptr) {
        return 0;
    }

    uint32_t now = tick_source();
    uint32_t previous = last_tick.exchange(now);
    if (now < previous) {
        // 32-bit counter wrapped since the last sample
        tick_high.fetch_add(1ULL << 32);
    }
    return tick_high.load() | now;
}

uint64_t SystemTiming::GetMilliseconds() {
    uint64_t ticks = GetTicks();
    if (tick_rate_hz == 1000) {
        return ticks;
    }
    return (ticks * 1000ULL) / tick_rate_hz;
}

uint32_t SystemTiming::GetSeconds() {
    return static_cast<uint32_t>(GetMilliseconds() / 1000ULL);
}

bool SystemTiming::HasElapsed(uint64_t start_ms, uint32_t ms) {
    uint64_t now = GetMilliseconds();
    if (now < start_ms) {
        // Tick source was replaced underneath the caller
        return true;
    }
    return (now - start_ms) >= ms;
}

} // namespace SystemServices
} // namespace Middleware
