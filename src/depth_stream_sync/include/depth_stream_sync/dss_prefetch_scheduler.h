#pragma once

#include "dss_jitter_buffer.h"
#include "dss_time.h"
#include "dss_tuning.h"

#include <vector>

namespace dss {

// What the scheduler needs from the transport: link estimates, the current
// request pressure, and a way to issue requests.
class FrameRequester {
public:
    virtual ~FrameRequester() = default;
    virtual double RoundTripMs() const = 0;
    virtual int InflightCount() const = 0;
    virtual void RequestFrame(TimeMs t) = 0;
};

struct TickReport {
    double lead_ms = 0.0;
    double timeout_ms = 0.0;
    double window_start_ms = 0.0;
    double window_end_ms = 0.0;
    int available_slots = 0;
    bool throttled = false;          // no free slots, nothing requested
    std::vector<TimeMs> issued;
};

// Turns playback position into a bounded batch of frame requests.
// Call Tick() once per display refresh; it never blocks.
class PrefetchScheduler {
public:
    static constexpr double WINDOW_MS = 3000.0;
    static constexpr double AUTO_LEAD_MARGIN_MS = 100.0;
    static constexpr double AUTO_LEAD_MIN_MS = 100.0;
    static constexpr double AUTO_LEAD_MAX_MS = 3000.0;
    static constexpr double MIN_TIMEOUT_MS = 1000.0;
    static constexpr double TIMEOUT_MARGIN_MS = 500.0;

    PrefetchScheduler(JitterBuffer& buffer, FrameRequester& requester, double fps = 30.0);

    void SetFps(double fps);
    double step_ms() const { return m_step_ms; }

    // tuning is the caller's copy for this tick
    TickReport Tick(double playback_ms, TuningSnapshot tuning);

    static double ComputeLeadMs(double rtt_ms, const TuningSnapshot& tuning);
    static double ComputeTimeoutMs(double rtt_ms);

private:
    JitterBuffer& m_buffer;
    FrameRequester& m_requester;
    double m_step_ms;
};

} // namespace dss
