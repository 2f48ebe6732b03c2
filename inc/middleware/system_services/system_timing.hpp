// inc/middleware/system_services/system_timing.hpp

#pragma once

#include "common/platform.hpp"
#include <atomic>

namespace Middleware {
namespace SystemServices {

/**
 * @brief Function returning the current value of a free-running tick counter
 *
 * On target this is xTaskGetTickCount; host tests install a fake counter.
 */
using TickSource = uint32_t (*)();

/**
 * @brief System Timing module providing the millisecond time base
 *
 * The tick source is 32 bits wide and wraps; SystemTiming extends it to a
 * monotonic 64-bit count as long as it is sampled at least once per wrap.
 * Without a tick source every timestamp reads 0.
 */
class SystemTiming {
private:
    TickSource tick_source;
    uint32_t tick_rate_hz;

    // Timestamp tracking
    std::atomic<uint64_t> tick_high;
    std::atomic<uint32_t> last_tick;

    uint64_t GetTicks();

    // Singleton pattern
    SystemTiming();
    SystemTiming(const SystemTiming&) = delete;
    SystemTiming& operator=(const SystemTiming&) = delete;

public:
    // Get singleton instance
    static SystemTiming& GetInstance();

    /**
     * @brief Install the tick counter backing the time base
     *
     * @param source Tick counter, nullptr detaches the current one
     * @param rate_hz Tick frequency, must be non-zero when source is set
     * @return INVALID_PARAM for a zero rate, OK otherwise
     */
    Platform::Status SetTickSource(TickSource source, uint32_t rate_hz);

    // Timestamp functions
    uint64_t GetMilliseconds();
    uint32_t GetSeconds();

    // True once at least `ms` milliseconds have passed since `start_ms`
    bool HasElapsed(uint64_t start_ms, uint32_t ms);
};

// Inline function to get system timing instance
inline SystemTiming& GetSystemTiming() {
    return SystemTiming::GetInstance();
}

inline uint64_t GetTimestampMs() {
    return GetSystemTiming().GetMilliseconds();
}

} // namespace SystemServices
} // namespace Middleware
