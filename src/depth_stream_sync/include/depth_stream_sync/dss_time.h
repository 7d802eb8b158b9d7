#pragma once

#include <chrono>
#include <cstdint>

namespace dss {

// Media time on the depth stream grid: integer milliseconds since stream start.
// Requests and frame timestamps share this unit so they correlate exactly.
using TimeMs = int64_t;

// Monotonic wall clock in fractional milliseconds. Used for RTT, jitter and
// request timeouts; never for media time.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double NowMs() const = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock() : m_origin(std::chrono::steady_clock::now()) {}

    double NowMs() const override {
        auto elapsed = std::chrono::steady_clock::now() - m_origin;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

private:
    std::chrono::steady_clock::time_point m_origin;
};

// Frame step in ms for a nominal frame rate (30 fps when unknown)
inline double frame_step_ms(double fps) {
    return 1000.0 / (fps > 0.0 ? fps : 30.0);
}

} // namespace dss
