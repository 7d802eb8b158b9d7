#include <depth_stream_sync/dss_link_estimators.h>

#include <algorithm>
#include <cmath>

namespace dss {

void RttEstimator::AddSample(double duration_ms) {
    if (duration_ms < 0.0) return;
    if (!m_has_sample) {
        m_rtt_ms = std::min(FIRST_SAMPLE_CAP_MS, duration_ms);
        m_has_sample = true;
        return;
    }
    double clamped = std::min(SAMPLE_CAP_MS, duration_ms);
    m_rtt_ms = m_rtt_ms * (1.0 - ALPHA) + clamped * ALPHA;
}

void JitterEstimator::OnArrival(double now_ms) {
    if (m_has_arrival) {
        m_gaps.push_back(now_ms - m_last_arrival_ms);
        if (m_gaps.size() > WINDOW) {
            m_gaps.pop_front();
        }
    }
    m_last_arrival_ms = now_ms;
    m_has_arrival = true;
}

void JitterEstimator::Reset() {
    m_gaps.clear();
    m_has_arrival = false;
    m_last_arrival_ms = 0.0;
}

double JitterEstimator::jitter_ms() const {
    if (m_gaps.size() < 2) return 0.0;
    double sum = 0.0;
    for (double g : m_gaps) sum += g;
    const double mean = sum / static_cast<double>(m_gaps.size());
    double sq = 0.0;
    for (double g : m_gaps) sq += (g - mean) * (g - mean);
    return std::sqrt(sq / static_cast<double>(m_gaps.size()));
}

} // namespace dss
