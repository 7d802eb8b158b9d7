#pragma once

#include "dss_frame.h"
#include "dss_request_tracker.h"
#include "dss_time.h"

#include <cstddef>
#include <limits>
#include <vector>

namespace dss {

// Time-indexed store of decoded depth frames plus the request table used for
// gap detection and timeout-based re-request.
//
// Owns the RequestTracker; FrameTransport records transmits into the same
// table through tracker().
class JitterBuffer {
public:
    static constexpr double MATCH_TOLERANCE_MS = 33.0;   // ~one frame at 30fps
    static constexpr TimeMs PRUNE_AGE_MS = 1000;         // frames this far behind playback go
    static constexpr TimeMs REQUEST_EXPIRY_MS = 2000;    // marks this far behind playback go
    static constexpr size_t MAX_FRAMES = 600;

    explicit JitterBuffer(const Clock& clock) : m_clock(clock) {}

    // Insert keeping ascending timestamp order (tail scan, arrivals are
    // near-ordered). Replaces a frame with the same timestamp.
    void Add(FramePtr frame);

    // Closest frame within MATCH_TOLERANCE_MS of t, or nullptr.
    // Prunes frames older than t - PRUNE_AGE_MS.
    FramePtr GetFrame(double t_ms);

    // Grid points in [start, end] with neither a stored frame strictly within
    // step/2 nor a live request. Returned points are marked requested at once;
    // sends of a re-issued point older than timeout_ms are expired.
    // Scanning stops after max_count results.
    std::vector<TimeMs> GetMissing(double start_ms, double end_ms, double step_ms,
                                   double timeout_ms,
                                   size_t max_count = std::numeric_limits<size_t>::max());

    // Expire request marks older than playback - REQUEST_EXPIRY_MS
    void Cleanup(double playback_ms);

    // Drop all frames and request marks (seek/replay)
    void Clear();

    size_t size() const { return m_frames.size(); }
    size_t requested_size() const { return m_tracker.RequestedCount(); }
    bool empty() const { return m_frames.empty(); }

    // Timestamps currently stored, ascending (diagnostics/tests)
    std::vector<TimeMs> timestamps() const;

    RequestTracker& tracker() { return m_tracker; }
    const RequestTracker& tracker() const { return m_tracker; }

private:
    bool has_frame_near(double t_ms, double radius_ms) const;

    const Clock& m_clock;
    std::vector<FramePtr> m_frames;  // ascending timestamp_ms
    RequestTracker m_tracker;
};

} // namespace dss
