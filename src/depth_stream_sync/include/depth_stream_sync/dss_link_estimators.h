#pragma once

#include <cstddef>
#include <deque>

namespace dss {

// Round-trip time as an exponential moving average.
// The first sample is clamped to 1000ms (a cold server may take seconds for
// the first frame); later samples are clamped to 2000ms before blending.
class RttEstimator {
public:
    static constexpr double ALPHA = 0.1;
    static constexpr double FIRST_SAMPLE_CAP_MS = 1000.0;
    static constexpr double SAMPLE_CAP_MS = 2000.0;

    void AddSample(double duration_ms);
    void Reset() { m_rtt_ms = 0.0; m_has_sample = false; }

    // 0 until the first sample
    double rtt_ms() const { return m_rtt_ms; }
    bool has_sample() const { return m_has_sample; }

private:
    double m_rtt_ms = 0.0;
    bool m_has_sample = false;
};

// Inter-arrival jitter: population standard deviation over the most recent
// WINDOW arrival gaps.
class JitterEstimator {
public:
    static constexpr size_t WINDOW = 30;

    void OnArrival(double now_ms);
    void Reset();

    // 0 with fewer than two gaps
    double jitter_ms() const;
    size_t sample_count() const { return m_gaps.size(); }

private:
    double m_last_arrival_ms = 0.0;
    bool m_has_arrival = false;
    std::deque<double> m_gaps;
};

} // namespace dss
